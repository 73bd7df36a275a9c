#pragma once
// Local stand-in for api.weather.gov: canned responses keyed by path, with a
// log of every request it saw.

#include "weathermcp/settings.hpp"

#include <chrono>
#include <httplib.h>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace test_support
{

class FakeNws
{
  public:
    struct Reply
    {
        int status{200};
        std::string body;
    };

    struct Seen
    {
        std::string path;
        std::string user_agent;
        std::string accept;
    };

    FakeNws()
    {
        server_.Get(R"(/.*)",
                    [this](const httplib::Request& req, httplib::Response& res)
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        seen_.push_back(Seen{req.path, req.get_header_value("User-Agent"),
                                             req.get_header_value("Accept")});
                        auto it = replies_.find(req.path);
                        if (it == replies_.end())
                        {
                            res.status = 404;
                            res.set_content(R"({"title":"Not Found"})", "application/problem+json");
                            return;
                        }
                        res.status = it->second.status;
                        res.set_content(it->second.body, "application/geo+json");
                    });
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        for (int i = 0; i < 200 && !server_.is_running(); ++i)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    ~FakeNws()
    {
        server_.stop();
        if (thread_.joinable())
            thread_.join();
    }

    FakeNws(const FakeNws&) = delete;
    FakeNws& operator=(const FakeNws&) = delete;

    void reply(const std::string& path, int status, std::string body)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_[path] = Reply{status, std::move(body)};
    }

    std::string base() const
    {
        return "http://127.0.0.1:" + std::to_string(port_);
    }

    /// Settings pointed at this server, with a short timeout
    weathermcp::Settings settings() const
    {
        weathermcp::Settings s;
        s.api_base = base();
        s.http_timeout_seconds = 5;
        return s;
    }

    std::vector<Seen> seen()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return seen_;
    }

    std::size_t hits()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return seen_.size();
    }

  private:
    httplib::Server server_;
    std::thread thread_;
    int port_{0};
    std::mutex mutex_;
    std::map<std::string, Reply> replies_;
    std::vector<Seen> seen_;
};

/// A base URL nothing listens on
inline std::string dead_base()
{
    httplib::Server probe;
    int port = probe.bind_to_any_port("127.0.0.1");
    probe.stop();
    return "http://127.0.0.1:" + std::to_string(port);
}

} // namespace test_support
