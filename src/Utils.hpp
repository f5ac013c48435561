#ifndef UTILS_HPP
#define UTILS_HPP

#include "Errors.hpp"
#include "Types.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <zlib.h>

inline std::string strategyToString(Strategy strategy) {
    switch (strategy) {
        case SuccessBiased:
            return "success";
        case FrequencyBiased:
            return "frequency";
        case Contagion:
            return "contagion";
        default:
            throw std::invalid_argument("Unknown strategy");
    }
}

inline std::string behaviorToString(Behavior behavior) {
    return behavior == Behavior::Adaptive ? "adaptive" : "legacy";
}

inline std::string paramValueToString(const ParamValue& value) {
    if (const auto* number = std::get_if<double>(&value)) {
        std::ostringstream out;
        out << *number;
        return out.str();
    }
    return std::get<std::string>(value);
}

inline std::vector<std::vector<double>> reshapeSquare(const std::vector<double>& flatValues) {
    size_t n = static_cast<size_t>(std::llround(std::sqrt(static_cast<double>(flatValues.size()))));
    if (n * n != flatValues.size()) {
        throw ConfigurationError("Adjacency matrix with " + std::to_string(flatValues.size()) +
                                 " entries is not square");
    }
    std::vector<std::vector<double>> matrix(n, std::vector<double>(n));
    for (size_t i = 0; i < n; i++) {
        for (size_t j = 0; j < n; j++) {
            matrix[i][j] = flatValues[i * n + j];
        }
    }
    return matrix;
}

// One flattened square matrix per line: comma-separated weights, a binary string
// "0110...", or single digits read as tenths.
inline std::vector<std::vector<double>> parseMatrixString(const std::string& str) {
    std::vector<double> flatValues;

    if (str.find(',') != std::string::npos) {
        std::stringstream ss(str);
        std::string cell;
        while (std::getline(ss, cell, ',')) {
            if (cell.empty()) {
                flatValues.push_back(0.0);
                continue;
            }
            try {
                flatValues.push_back(std::stod(cell));
            } catch (const std::exception&) {
                throw ConfigurationError("Malformed adjacency weight '" + cell + "'");
            }
        }
    } else if (str.find_first_not_of("01") == std::string::npos) {
        for (char c : str) {
            flatValues.push_back(c == '1' ? 1.0 : 0.0);
        }
    } else {
        for (char digit : str) {
            if (digit < '0' || digit > '9') {
                throw ConfigurationError(std::string("Malformed adjacency digit '") + digit + "'");
            }
            flatValues.push_back((digit - '0') / 10.0);
        }
    }
    return reshapeSquare(flatValues);
}

inline std::vector<std::vector<std::vector<double>>> readAdjacencyMatrices(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw ConfigurationError("Could not open file " + filePath);
    }

    std::vector<std::vector<std::vector<double>>> matrices;
    std::string line;

    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        matrices.push_back(parseMatrixString(line));
    }

    std::cout << "Loaded " << matrices.size() << " adjacency matrices." << '\n';

    return matrices;
}

inline std::vector<std::string> summaryToCsv(const std::vector<SummaryRow>& rows,
                                             const std::vector<std::string>& groupBy) {
    std::string header;
    for (const auto& column : groupBy) {
        header += column + ",";
    }
    header += "replicates,failures,success_rate,legacy_rate,timeout_rate,mean_time_to_fixation,mean_steps";

    std::vector<std::string> csvData;
    csvData.push_back(header);
    for (const auto& row : rows) {
        std::string csvLine;
        for (const auto& column : groupBy) {
            csvLine += paramValueToString(row.key.at(column)) + ",";
        }
        csvLine += std::to_string(row.replicates) + "," +
                   std::to_string(row.failures) + "," +
                   std::to_string(row.successRate) + "," +
                   std::to_string(row.legacyRate) + "," +
                   std::to_string(row.timeoutRate) + "," +
                   (std::isnan(row.meanTimeToFixation) ? std::string("NA") : std::to_string(row.meanTimeToFixation)) + "," +
                   (std::isnan(row.meanSteps) ? std::string("NA") : std::to_string(row.meanSteps));
        csvData.push_back(csvLine);
    }
    return csvData;
}

inline std::vector<std::string> seriesToCsv(const TrialResult& result) {
    std::vector<std::string> csvData;
    csvData.push_back("step,legacy,adaptive");
    for (const auto& record : result.series) {
        csvData.push_back(std::to_string(record.step) + "," +
                          std::to_string(record.counts[Behavior::Legacy]) + "," +
                          std::to_string(record.counts[Behavior::Adaptive]));
    }
    return csvData;
}

// Streams the lines straight into outputCsvPath + ".gz"; no plain CSV is left behind
inline void writeAndCompressCSV(const std::string& outputCsvPath, const std::vector<std::string>& csvData) {
    std::string compressedFilePath = outputCsvPath + ".gz";
    gzFile dest = gzopen(compressedFilePath.c_str(), "wb");
    if (dest == nullptr) {
        std::cerr << "Failed to open file for writing: " << compressedFilePath << '\n';
        return;
    }

    bool ok = true;
    for (size_t i = 0; ok && i < csvData.size(); ++i) {
        ok = gzputs(dest, (csvData[i] + "\n").c_str()) >= 0;
    }
    if (gzclose(dest) != Z_OK || !ok) {
        std::cerr << "Failed to write compressed CSV " << compressedFilePath << '\n';
    }
}

#endif // UTILS_HPP
