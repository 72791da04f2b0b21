/**
 * @file InputBatchReader.hpp
 * @brief File-system collaborator that delivers one cycle's input batches.
 */

#pragma once

#include <map>
#include <string>
#include "application/AnalysisPipeline.hpp"

namespace worldpulse::infrastructure {

/**
 * @class InputBatchReader
 * @brief Reads news.json, markets.json, geo.json and detections.json from a directory.
 *
 * Each file holds a JSON array. A missing file is an empty batch. Records that
 * fail to decode are skipped and counted, never fatal.
 */
class InputBatchReader {
public:
    InputBatchReader(std::string inputDir, std::map<std::string, int> sourceTiers = {});

    application::CycleInput read(domain::Timestamp now) const;

    const std::string& inputDir() const { return m_inputDir; }

private:
    std::string m_inputDir;
    std::map<std::string, int> m_sourceTiers;
};

} // namespace worldpulse::infrastructure
