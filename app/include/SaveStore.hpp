#ifndef SAVE_STORE_HPP
#define SAVE_STORE_HPP

#include "Types.hpp"

#include <optional>
#include <string>

struct SaveRecord {
    std::optional<LocaleId> locale;
};

// Reads and writes the per-user save file ({"locale": "<id>" | null}).
class SaveStore {
public:
    explicit SaveStore(std::string file_path);

    // Returns an empty record when the file is missing, unreadable or malformed.
    SaveRecord load() const;
    bool save(const SaveRecord& record) const;

    const std::string& file_path() const { return file_path_; }

private:
    std::string file_path_;
};

#endif
