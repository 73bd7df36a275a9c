#include "weathermcp/weather/weather_tools.hpp"

#include <cassert>
#include <iostream>

using weathermcp::Json;
using namespace weathermcp::weather;

int main()
{
    // Full alert
    {
        Json feature = {{"properties",
                         {{"event", "Flood Warning"},
                          {"areaDesc", "Marin"},
                          {"severity", "Severe"},
                          {"description", "River rising"},
                          {"instruction", "Move to higher ground"}}}};
        assert(format_alert(feature) == "Event: Flood Warning\n"
                                        "Area: Marin\n"
                                        "Severity: Severe\n"
                                        "Description: River rising\n"
                                        "Instructions: Move to higher ground");
        std::cout << "  [PASS] full alert" << std::endl;
    }

    // Missing and null fields get placeholders
    {
        Json feature = {{"properties", {{"event", "Heat Advisory"}, {"instruction", nullptr}}}};
        assert(format_alert(feature) == "Event: Heat Advisory\n"
                                        "Area: Unknown\n"
                                        "Severity: Unknown\n"
                                        "Description: No description available\n"
                                        "Instructions: No specific instructions provided");

        assert(format_alert(Json::object()).rfind("Event: Unknown\n", 0) == 0);
        std::cout << "  [PASS] alert placeholders" << std::endl;
    }

    // Forecast periods
    {
        Json period = {{"name", "Tonight"},
                       {"shortForecast", "Clear"},
                       {"temperature", 55},
                       {"temperatureUnit", "F"},
                       {"windSpeed", "5 mph"}};
        assert(format_period(period) == "Tonight: Clear (55°F) Wind 5 mph");

        assert(format_period(Json::object()) == "Period: n/a (n/a°) Wind ");

        Json partial = {{"name", "Monday"}, {"temperature", nullptr}, {"windSpeed", "10 mph"}};
        assert(format_period(partial) == "Monday: n/a (n/a°) Wind 10 mph");
        std::cout << "  [PASS] forecast periods" << std::endl;
    }

    std::cout << "weather format: all tests passed" << std::endl;
    return 0;
}
