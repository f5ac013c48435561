#ifndef CHECKPOINT_HPP
#define CHECKPOINT_HPP

#include "Types.hpp"

#include <set>
#include <string>
#include <utility>
#include <vector>

// Gzip-compressed record store for resumable sweeps. Records are keyed by
// (combination key, replicate); adding a key twice keeps the first record.
// Writes go to a temporary file that replaces the checkpoint in one rename,
// so an interrupted write leaves the previous checkpoint intact.
// Pending records are flushed when the checkpoint goes out of scope.
class Checkpoint {
public:
    explicit Checkpoint(std::string path);
    ~Checkpoint();

    Checkpoint(const Checkpoint&) = delete;
    Checkpoint& operator=(const Checkpoint&) = delete;

    // Reads the file if it exists. Throws CheckpointError when it is unreadable or corrupt.
    void load();
    // Moves a corrupt file aside to <path>.corrupt and forgets all records
    void discard();

    bool contains(const std::string& key, size_t replicate) const;
    bool add(const ExperimentRecord& record);
    void flush();

    const std::vector<ExperimentRecord>& records() const { return stored; }
    const std::string& path() const { return filePath; }
    bool hasPendingWrites() const { return dirty; }

private:
    std::string filePath;
    std::vector<ExperimentRecord> stored;
    std::set<std::pair<std::string, size_t>> index;
    bool dirty = false;
};

// "name=d:<double>;name=s:<text>" with names in sorted order
std::string combinationKey(const ParamCombination& combination);
ParamCombination parseCombinationKey(const std::string& key);

std::string recordToLine(const ExperimentRecord& record);
ExperimentRecord recordFromLine(const std::string& line);

#endif // CHECKPOINT_HPP
