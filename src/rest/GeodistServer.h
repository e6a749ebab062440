#pragma once

#include <string>
#include <map>
#include <memory>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "../core/DistanceService.h"

namespace rest
{

    class GeodistServer
    {
    public:
        GeodistServer(uint16_t port, std::shared_ptr<core::DistanceService> service);
        void start();
        void stop();

        // Handler for GET /distance, exposed for tests. Returns the HTTP status.
        static int handleDistance(const core::DistanceService &service,
                                  const std::multimap<std::string, std::string> &params,
                                  nlohmann::json &body);

    private:
        uint16_t port_;
        std::shared_ptr<core::DistanceService> service_;
        std::unique_ptr<httplib::Server> server_;
    };

} // namespace rest
