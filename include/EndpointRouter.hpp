#pragma once
#include <string>
#include <string_view>
#include <optional>
#include <unordered_map>
#include "Types.hpp"
#include "ConfigurationManager.hpp"

class EndpointRouter
{
private:
    std::unordered_map<std::string, FeedKind> routes;

public:
    explicit EndpointRouter(RouteSettings const& settings);

    // Matches the path part of a request target, query ignored.
    [[nodiscard]] std::optional<FeedKind> match(std::string_view target) const;

    // "f=json" selects JSON; anything else, or no f at all, is protobuf.
    // Keys and values are percent-decoded first.
    [[nodiscard]] static FeedFormat parseFormat(std::string_view target);
    // application/x-www-form-urlencoded decoding of one key or value.
    [[nodiscard]] static std::string decodeQueryComponent(std::string_view component);
    [[nodiscard]] static std::string_view pathOf(std::string_view target) noexcept;
};
