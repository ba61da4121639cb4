#pragma once

#include "DictionaryTerm.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace dictionary
{

/**
 * @brief File-backed term store persisted as grouped JSON.
 *
 * Mutations build a new term list and swap it in under a mutex, so a
 * snapshot taken by a running detection never sees a partial update.
 */
class DictionaryStore : public ITermSource
{
public:
    explicit DictionaryStore(const std::string& directory = "dictionaries");

    DictionaryStore(const DictionaryStore&) = delete;
    DictionaryStore& operator=(const DictionaryStore&) = delete;

    // Missing file yields an empty store; a malformed file is reported and
    // also yields an empty store.
    bool load();

    std::shared_ptr<const TermList> snapshot() const override;

    bool addTerm(const std::string& value, const std::string& label = std::string(kDefaultLabel),
                 const std::string& category = std::string(kDefaultCategory));
    bool removeTerm(const std::string& value);

    /**
     * @brief Import rows of "種別,値[,ラベル]"; the first row is a header.
     * @return Number of terms added
     */
    std::size_t importCsv(std::string_view csv_content);

    std::size_t size() const;
    std::string updatedAt() const;
    const std::string& filePath() const { return file_path_; }
    std::string lastError() const;

    /// Japanese CSV category column to store category
    static std::string mapCsvCategory(const std::string& category_ja);

    /// Split one CSV record, honouring double-quoted fields
    static std::vector<std::string> parseCsvRecord(std::string_view line);

private:
    bool saveLocked(const TermList& terms, const std::string& updated_at);
    static bool containsValue(const TermList& terms, const std::string& value);
    static std::string nowIso8601();

    std::string directory_;
    std::string file_path_;
    std::string version_ = "1.0";

    mutable std::mutex mutex_;
    std::shared_ptr<const TermList> terms_;
    std::string updated_at_;
    std::string last_error_;
};

} // namespace dictionary
