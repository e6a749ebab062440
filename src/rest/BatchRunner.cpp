#include "BatchRunner.h"
#include "../core/GeodesicError.h"
#include <spdlog/spdlog.h>

namespace rest
{
    nlohmann::json BatchRunner::resultToJson(const core::DistanceResult &result)
    {
        nlohmann::json j;
        j["distance"] = result.distance;
        j["forward_azimuth"] = result.forward_azimuth;
        j["backward_azimuth"] = result.backward_azimuth;
        return j;
    }

    nlohmann::json BatchRunner::statsToJson(const core::CacheStats &stats)
    {
        nlohmann::json j;
        j["hits"] = stats.hits;
        j["misses"] = stats.misses;
        j["insertions"] = stats.insertions;
        j["evictions"] = stats.evictions;
        j["expirations"] = stats.expirations;
        j["entries"] = stats.entries;
        return j;
    }

    std::string BatchRunner::runFromJson(const core::DistanceService &service, const std::string &json_input, bool cached)
    {
        // 1. Parse pairs
        std::vector<core::PositionPair> pairs;
        try
        {
            pairs = core::JsonPairParser::parseString(json_input);
        }
        catch (const std::exception &ex)
        {
            nlohmann::json err;
            err["error"] = std::string("Failed to parse pairs: ") + ex.what();
            return err.dump();
        }

        return resolvePairs(service, pairs, cached).dump();
    }

    nlohmann::json BatchRunner::resolvePairs(const core::DistanceService &service, const std::vector<core::PositionPair> &pairs, bool cached)
    {
        spdlog::info("BatchRunner: resolving {} pairs ({})", pairs.size(), cached ? "cached" : "uncached");

        // A failing pair does not fail the batch
        nlohmann::json results = nlohmann::json::array();
        for (const auto &pair : pairs)
        {
            try
            {
                core::DistanceResult r = cached ? service.resolve(pair.a, pair.b)
                                                : service.computeDirect(pair.a, pair.b);
                results.push_back(resultToJson(r));
            }
            catch (const core::GeodesicError &ex)
            {
                nlohmann::json err;
                err["error"] = ex.what();
                err["kind"] = core::errorKindName(ex.kind());
                results.push_back(err);
            }
        }

        nlohmann::json out;
        out["results"] = results;
        return out;
    }

} // namespace rest
