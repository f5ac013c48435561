#include "Checkpoint.hpp"
#include "Errors.hpp"
#include "Trial.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <zlib.h>

namespace {

const std::string kHeader = "# cascade-checkpoint v1";

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t end = text.find(delimiter, start);
        if (end == std::string::npos) {
            fields.push_back(text.substr(start));
            return fields;
        }
        fields.push_back(text.substr(start, end - start));
        start = end + 1;
    }
}

// 17 significant digits round-trip every double
std::string formatDouble(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.17g", value);
    return buffer;
}

double parseDouble(const std::string& text) {
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size()) {
        throw CheckpointError("Malformed number '" + text + "' in checkpoint");
    }
    return value;
}

size_t parseCount(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw CheckpointError("Malformed count '" + text + "' in checkpoint");
    }
    return static_cast<size_t>(std::strtoull(text.c_str(), nullptr, 10));
}

// Error messages are free text; keep them on one field
std::string sanitize(std::string text) {
    for (char& c : text) {
        if (c == '\t' || c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return text;
}

} // namespace

std::string combinationKey(const ParamCombination& combination) {
    std::string key;
    for (const auto& [name, value] : combination) {
        if (!key.empty()) {
            key += ';';
        }
        key += name + "=";
        if (const auto* number = std::get_if<double>(&value)) {
            key += "d:" + formatDouble(*number);
        } else {
            key += "s:" + std::get<std::string>(value);
        }
    }
    return key;
}

ParamCombination parseCombinationKey(const std::string& key) {
    ParamCombination combination;
    if (key.empty()) {
        return combination;
    }
    for (const auto& entry : split(key, ';')) {
        size_t eq = entry.find('=');
        if (eq == std::string::npos || eq == 0 || entry.size() < eq + 3 || entry[eq + 2] != ':') {
            throw CheckpointError("Malformed parameter '" + entry + "' in checkpoint");
        }
        std::string name = entry.substr(0, eq);
        char type = entry[eq + 1];
        std::string text = entry.substr(eq + 3);
        if (type == 'd') {
            combination[name] = parseDouble(text);
        } else if (type == 's') {
            combination[name] = text;
        } else {
            throw CheckpointError("Unknown value type in checkpoint parameter '" + entry + "'");
        }
    }
    return combination;
}

std::string recordToLine(const ExperimentRecord& record) {
    return combinationKey(record.params) + "\t" +
           std::to_string(record.replicate) + "\t" +
           terminalToString(record.terminal) + "\t" +
           std::to_string(record.steps) + "\t" +
           std::to_string(record.adaptive) + "\t" +
           std::to_string(record.population) + "\t" +
           sanitize(record.error);
}

ExperimentRecord recordFromLine(const std::string& line) {
    std::vector<std::string> fields = split(line, '\t');
    if (fields.size() != 7) {
        throw CheckpointError("Checkpoint line has " + std::to_string(fields.size()) +
                              " fields, expected 7");
    }

    ExperimentRecord record;
    record.params = parseCombinationKey(fields[0]);
    record.replicate = parseCount(fields[1]);
    try {
        record.terminal = terminalFromString(fields[2]);
    } catch (const std::invalid_argument& e) {
        throw CheckpointError(std::string("Corrupt checkpoint record: ") + e.what());
    }
    record.steps = parseCount(fields[3]);
    record.adaptive = parseCount(fields[4]);
    record.population = parseCount(fields[5]);
    record.error = fields[6];
    return record;
}

Checkpoint::Checkpoint(std::string path)
    : filePath(std::move(path)) {}

Checkpoint::~Checkpoint() {
    if (!dirty) {
        return;
    }
    try {
        flush();
    } catch (const CheckpointError& e) {
        std::cerr << "Failed to write checkpoint " << filePath << ": " << e.what() << '\n';
    }
}

void Checkpoint::load() {
    std::error_code ec;
    if (!std::filesystem::exists(filePath, ec)) {
        if (ec) {
            throw CheckpointError("Could not access checkpoint " + filePath + ": " + ec.message());
        }
        return;
    }

    gzFile file = gzopen(filePath.c_str(), "rb");
    if (file == nullptr) {
        throw CheckpointError("Could not open checkpoint " + filePath);
    }

    std::vector<std::string> lines;
    std::string current;
    bool truncatedLine = false;
    char buffer[8192];
    while (gzgets(file, buffer, sizeof(buffer)) != nullptr) {
        current += buffer;
        if (!current.empty() && current.back() == '\n') {
            current.pop_back();
            lines.push_back(current);
            current.clear();
        }
    }
    // Every line is written with a newline; anything left over was cut short
    if (!current.empty()) {
        truncatedLine = true;
    }

    int errnum = Z_OK;
    gzerror(file, &errnum);
    int closeStatus = gzclose(file);
    if (errnum != Z_OK || closeStatus != Z_OK || truncatedLine) {
        throw CheckpointError("Checkpoint " + filePath + " is truncated or not valid gzip data");
    }

    if (lines.empty() || lines[0] != kHeader) {
        throw CheckpointError("Checkpoint " + filePath + " has no valid header");
    }

    std::vector<ExperimentRecord> loaded;
    for (size_t i = 1; i < lines.size(); ++i) {
        if (lines[i].empty()) {
            continue;
        }
        try {
            loaded.push_back(recordFromLine(lines[i]));
        } catch (const CheckpointError& e) {
            throw CheckpointError("Checkpoint " + filePath + " line " + std::to_string(i + 1) +
                                  ": " + e.what());
        }
    }

    for (const auto& record : loaded) {
        if (index.insert({combinationKey(record.params), record.replicate}).second) {
            stored.push_back(record);
        }
    }
}

void Checkpoint::discard() {
    std::error_code ec;
    if (std::filesystem::exists(filePath, ec)) {
        std::filesystem::rename(filePath, filePath + ".corrupt", ec);
        if (ec) {
            throw CheckpointError("Could not move corrupt checkpoint " + filePath + " aside: " +
                                  ec.message());
        }
    }
    stored.clear();
    index.clear();
    dirty = false;
}

bool Checkpoint::contains(const std::string& key, size_t replicate) const {
    return index.count({key, replicate}) > 0;
}

bool Checkpoint::add(const ExperimentRecord& record) {
    if (!index.insert({combinationKey(record.params), record.replicate}).second) {
        return false;
    }
    stored.push_back(record);
    dirty = true;
    return true;
}

void Checkpoint::flush() {
    std::string tmpPath = filePath + ".tmp";
    gzFile file = gzopen(tmpPath.c_str(), "wb");
    if (file == nullptr) {
        throw CheckpointError("Could not open " + tmpPath + " for writing");
    }

    bool ok = gzputs(file, (kHeader + "\n").c_str()) >= 0;
    for (size_t i = 0; ok && i < stored.size(); ++i) {
        ok = gzputs(file, (recordToLine(stored[i]) + "\n").c_str()) >= 0;
    }
    if (gzclose(file) != Z_OK || !ok) {
        throw CheckpointError("Failed to write checkpoint data to " + tmpPath);
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, filePath, ec);
    if (ec) {
        throw CheckpointError("Could not replace checkpoint " + filePath + ": " + ec.message());
    }
    dirty = false;
}
