#pragma once
#include <string>

// Receiver of data change notifications. Will drive cache invalidation once
// the warehouse publishes which feeds changed; until then it only logs.
class Listener
{
public:
    virtual ~Listener() = default;
    virtual void onMessage(std::string const& topic, std::string const& payload) = 0;
};

class LoggingListener : public Listener
{
public:
    void onMessage(std::string const& topic, std::string const& payload) override;
};
