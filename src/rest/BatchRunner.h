#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../core/DistanceCache.h"
#include "../core/DistanceResult.h"
#include "../core/DistanceService.h"
#include "../core/JsonPairParser.h"

namespace rest
{

    class BatchRunner
    {
    public:
        // Resolves every pair in a {"pairs": [...]} document; never throws on bad input
        static std::string runFromJson(const core::DistanceService &service, const std::string &json_input, bool cached = true);

        // {"results": [...]} with one entry per pair, either a result or an {"error", "kind"} object
        static nlohmann::json resolvePairs(const core::DistanceService &service, const std::vector<core::PositionPair> &pairs, bool cached);

        static nlohmann::json resultToJson(const core::DistanceResult &result);
        static nlohmann::json statsToJson(const core::CacheStats &stats);
    };

} // namespace rest
