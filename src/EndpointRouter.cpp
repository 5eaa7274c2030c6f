#include "EndpointRouter.hpp"

namespace
{

int hexValue(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}

EndpointRouter::EndpointRouter(RouteSettings const& settings)
{
    routes.emplace(settings.serviceAlerts, FeedKind::ServiceAlerts);
    routes.emplace(settings.tripUpdates, FeedKind::TripUpdates);
    routes.emplace(settings.vehiclePositions, FeedKind::VehiclePositions);
}

std::string_view EndpointRouter::pathOf(std::string_view target) noexcept
{
    return target.substr(0, target.find('?'));
}

std::optional<FeedKind> EndpointRouter::match(std::string_view target) const
{
    auto it = routes.find(std::string(pathOf(target)));
    if (it == routes.end())
        return std::nullopt;
    return it->second;
}

std::string EndpointRouter::decodeQueryComponent(std::string_view component)
{
    std::string out;
    out.reserve(component.size());

    for (std::size_t i = 0; i < component.size(); ++i)
    {
        char c = component[i];
        if (c == '+')
        {
            out.push_back(' ');
        }
        else if (c == '%' && i + 2 < component.size() && hexValue(component[i + 1]) >= 0 && hexValue(component[i + 2]) >= 0)
        {
            out.push_back(static_cast<char>(hexValue(component[i + 1]) * 16 + hexValue(component[i + 2])));
            i += 2;
        }
        else
        {
            // Malformed escapes pass through unchanged.
            out.push_back(c);
        }
    }
    return out;
}

FeedFormat EndpointRouter::parseFormat(std::string_view target)
{
    auto question = target.find('?');
    if (question == std::string_view::npos)
        return FeedFormat::Protobuf;

    std::string_view query = target.substr(question + 1);
    std::optional<std::string> selector;

    // Repeated selectors: the last one wins.
    while (!query.empty())
    {
        auto amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

        auto eq = pair.find('=');
        if (decodeQueryComponent(pair.substr(0, eq)) == "f")
            selector = eq == std::string_view::npos ? std::string{} : decodeQueryComponent(pair.substr(eq + 1));
    }

    return selector && *selector == "json" ? FeedFormat::Json : FeedFormat::Protobuf;
}
