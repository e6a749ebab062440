#include "GeodistServer.h"
#include "BatchRunner.h"
#include "../core/GeodesicError.h"
#include "../core/JsonPairParser.h"
#include <iostream>
#include <stdexcept>
#include <vector>
#include <spdlog/spdlog.h>

namespace rest
{
    namespace
    {
        bool readCoordinate(const std::multimap<std::string, std::string> &params, const std::string &name,
                            double &out, std::string &error)
        {
            auto it = params.find(name);
            if (it == params.end() || it->second.empty())
            {
                error = "Missing '" + name + "' query parameter";
                return false;
            }
            try
            {
                size_t pos = 0;
                out = std::stod(it->second, &pos);
                if (pos != it->second.size())
                {
                    error = "Invalid number for '" + name + "': " + it->second;
                    return false;
                }
            }
            catch (const std::exception &)
            {
                error = "Invalid number for '" + name + "': " + it->second;
                return false;
            }
            return true;
        }
    } // namespace

    GeodistServer::GeodistServer(uint16_t port, std::shared_ptr<core::DistanceService> service)
        : port_(port), service_(std::move(service))
    {
        if (!service_)
        {
            throw std::invalid_argument("GeodistServer: service is null");
        }
    }

    int GeodistServer::handleDistance(const core::DistanceService &service,
                                      const std::multimap<std::string, std::string> &params,
                                      nlohmann::json &body)
    {
        double lat1 = 0.0, lon1 = 0.0, lat2 = 0.0, lon2 = 0.0;
        std::string error;
        if (!readCoordinate(params, "lat1", lat1, error) || !readCoordinate(params, "lon1", lon1, error) ||
            !readCoordinate(params, "lat2", lat2, error) || !readCoordinate(params, "lon2", lon2, error))
        {
            body = nlohmann::json::object();
            body["error"] = error;
            return 400;
        }

        bool cached = true;
        auto cached_it = params.find("cached");
        if (cached_it != params.end() && (cached_it->second == "false" || cached_it->second == "0"))
        {
            cached = false;
        }

        core::Position a(lat1, lon1);
        core::Position b(lat2, lon2);
        try
        {
            core::DistanceResult r = cached ? service.resolve(a, b) : service.computeDirect(a, b);
            body = BatchRunner::resultToJson(r);
            return 200;
        }
        catch (const core::GeodesicError &ex)
        {
            body = nlohmann::json::object();
            body["error"] = ex.what();
            body["kind"] = core::errorKindName(ex.kind());
            return ex.kind() == core::ErrorKind::InvalidInput ? 400 : 500;
        }
    }

    void GeodistServer::start()
    {
        server_ = std::make_unique<httplib::Server>();

        // GET /distance?lat1=&lon1=&lat2=&lon2=[&cached=false]
        server_->Get("/distance", [this](const httplib::Request &req, httplib::Response &res)
                     {
            nlohmann::json body;
            res.status = handleDistance(*service_, req.params, body);
            res.set_content(body.dump(), "application/json"); });

        // POST /distances with a {"pairs": [...]} body
        server_->Post("/distances", [this](const httplib::Request &req, httplib::Response &res)
                      {
            spdlog::info("GeodistServer: batch request ({} bytes)", req.body.size());
            bool cached = req.get_param_value("cached") != "false";
            std::vector<core::PositionPair> pairs;
            try {
                pairs = core::JsonPairParser::parseString(req.body);
            } catch (const std::exception& ex) {
                nlohmann::json err_json;
                err_json["error"] = ex.what();
                res.status = 400;
                res.set_content(err_json.dump(), "application/json");
                return;
            }
            res.status = 200;
            res.set_content(BatchRunner::resolvePairs(*service_, pairs, cached).dump(), "application/json"); });

        server_->Get("/cache/stats", [this](const httplib::Request &, httplib::Response &res)
                     {
            res.status = 200;
            res.set_content(BatchRunner::statsToJson(service_->cache()->stats()).dump(), "application/json"); });

        const core::CacheConfig &cfg = service_->cache()->config();
        std::cout << "===========================================" << std::endl;
        std::cout << "  Geodist REST API Server" << std::endl;
        std::cout << "===========================================" << std::endl;
        std::cout << "  GET  /distance" << std::endl;
        std::cout << "  POST /distances" << std::endl;
        std::cout << "  GET  /cache/stats" << std::endl;
        std::cout << "  Port:         " << port_ << std::endl;
        std::cout << "  Idle timeout: " << cfg.time_to_idle.count() << " ms" << std::endl;
        std::cout << "  Max capacity: " << cfg.max_capacity << std::endl;
        std::cout << "===========================================" << std::endl;

        spdlog::info("GeodistServer: listening on port {}", port_);
        if (!server_->listen("0.0.0.0", port_))
        {
            spdlog::error("GeodistServer: failed to listen on port {}", port_);
            throw std::runtime_error("GeodistServer: failed to listen on port " + std::to_string(port_));
        }
    }

    void GeodistServer::stop()
    {
        if (server_)
        {
            server_->stop();
        }
    }

} // namespace rest
