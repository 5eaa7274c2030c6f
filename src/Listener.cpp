#include <iostream>
#include "Listener.hpp"

void LoggingListener::onMessage(std::string const& topic, std::string const& payload)
{
    std::cout << "[Listener] " << topic << ": " << payload << std::endl;
}
