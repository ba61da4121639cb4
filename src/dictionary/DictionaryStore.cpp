#include "DictionaryStore.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace dictionary
{

namespace
{

std::string trim(std::string_view s)
{
    const char* ws = " \t\r\n\f\v";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string_view::npos)
        return {};
    auto end = s.find_last_not_of(ws);
    return std::string(s.substr(begin, end - begin + 1));
}

} // namespace

DictionaryStore::DictionaryStore(const std::string& directory)
    : directory_(directory)
    , file_path_((fs::path(directory) / "custom.json").string())
    , terms_(std::make_shared<const TermList>())
{
}

bool DictionaryStore::load()
{
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_.clear();

    std::error_code ec;
    if (!fs::exists(file_path_, ec))
    {
        PLOG_DEBUG << "[DictionaryStore] No dictionary file at " << file_path_ << ", starting empty";
        terms_ = std::make_shared<const TermList>();
        return true;
    }

    std::ifstream file(file_path_);
    if (!file.is_open())
    {
        last_error_ = "Failed to open dictionary file: " + file_path_;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Dictionary, "Failed to read dictionary", last_error_);
        terms_ = std::make_shared<const TermList>();
        return false;
    }

    try
    {
        json j;
        file >> j;

        if (!j.is_object())
        {
            last_error_ = "Invalid dictionary format (expected object): " + file_path_;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Dictionary, "Dictionary file is malformed",
                                              last_error_);
            terms_ = std::make_shared<const TermList>();
            return false;
        }

        auto terms = std::make_shared<TermList>();
        version_ = j.value("version", std::string("1.0"));
        updated_at_ = j.value("updated_at", std::string());

        if (j.contains("entries") && j["entries"].is_object())
        {
            for (auto& [category, items] : j["entries"].items())
            {
                if (!items.is_array())
                {
                    PLOG_WARNING << "[DictionaryStore] Skipping non-array group: " << category;
                    continue;
                }
                for (const auto& item : items)
                {
                    if (!item.is_object() || !item.contains("value") || !item["value"].is_string())
                    {
                        PLOG_WARNING << "[DictionaryStore] Skipping malformed entry in group: " << category;
                        continue;
                    }
                    std::string value = item["value"].get<std::string>();
                    if (value.empty() || containsValue(*terms, value))
                        continue;
                    terms->push_back({ std::move(value), item.value("label", std::string(kDefaultLabel)), category });
                }
            }
        }

        PLOG_INFO << "[DictionaryStore] Loaded " << terms->size() << " terms from " << file_path_;
        terms_ = std::move(terms);
        return true;
    }
    catch (const json::exception& e)
    {
        last_error_ = std::string("JSON parse error in ") + file_path_ + ": " + e.what();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Dictionary, "Dictionary file is malformed",
                                          last_error_);
        terms_ = std::make_shared<const TermList>();
        return false;
    }
}

std::shared_ptr<const TermList> DictionaryStore::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return terms_;
}

bool DictionaryStore::addTerm(const std::string& value, const std::string& label, const std::string& category)
{
    if (value.empty())
        return false;

    std::lock_guard<std::mutex> lock(mutex_);
    if (containsValue(*terms_, value))
        return false;

    TermList next = *terms_;
    next.push_back({ value, label.empty() ? std::string(kDefaultLabel) : label,
                     category.empty() ? std::string(kDefaultCategory) : category });

    std::string stamp = nowIso8601();
    if (!saveLocked(next, stamp))
        return false;

    terms_ = std::make_shared<const TermList>(std::move(next));
    updated_at_ = std::move(stamp);
    return true;
}

bool DictionaryStore::removeTerm(const std::string& value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    TermList next;
    next.reserve(terms_->size());
    bool removed = false;
    for (const auto& term : *terms_)
    {
        if (!removed && term.value == value)
        {
            removed = true;
            continue;
        }
        next.push_back(term);
    }
    if (!removed)
        return false;

    std::string stamp = nowIso8601();
    if (!saveLocked(next, stamp))
        return false;

    terms_ = std::make_shared<const TermList>(std::move(next));
    updated_at_ = std::move(stamp);
    return true;
}

std::size_t DictionaryStore::importCsv(std::string_view csv_content)
{
    std::lock_guard<std::mutex> lock(mutex_);
    TermList next = *terms_;
    std::size_t added = 0;

    std::string content = trim(csv_content);
    std::istringstream stream(content);
    std::string line;
    bool header = true;
    while (std::getline(stream, line))
    {
        if (header)
        {
            header = false;
            continue;
        }

        auto row = parseCsvRecord(line);
        if (row.size() < 2)
            continue;

        std::string category_ja = trim(row[0]);
        std::string value = trim(row[1]);
        std::string label = row.size() > 2 ? trim(row[2]) : category_ja;

        if (value.empty() || containsValue(next, value))
            continue;

        next.push_back({ std::move(value), std::move(label), mapCsvCategory(category_ja) });
        ++added;
    }

    if (added == 0)
        return 0;

    std::string stamp = nowIso8601();
    if (!saveLocked(next, stamp))
        return 0;

    PLOG_INFO << "[DictionaryStore] Imported " << added << " terms from CSV";
    terms_ = std::make_shared<const TermList>(std::move(next));
    updated_at_ = std::move(stamp);
    return added;
}

std::size_t DictionaryStore::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return terms_->size();
}

std::string DictionaryStore::updatedAt() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return updated_at_;
}

std::string DictionaryStore::lastError() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

std::string DictionaryStore::mapCsvCategory(const std::string& category_ja)
{
    static const std::map<std::string, std::string> kCategoryMap = {
        { "会社名", "companies" },
        { "会社", "companies" },
        { "企業", "companies" },
        { "プロジェクト", "projects" },
        { "案件", "projects" },
        { "個人名", "persons" },
        { "人名", "persons" },
        { "その他", "custom" },
        { "カスタム", "custom" },
    };
    auto it = kCategoryMap.find(category_ja);
    if (it == kCategoryMap.end())
        return std::string(kDefaultCategory);
    return it->second;
}

std::vector<std::string> DictionaryStore::parseCsvRecord(std::string_view line)
{
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    for (std::size_t i = 0; i < line.size(); ++i)
    {
        char c = line[i];
        if (in_quotes)
        {
            if (c == '"')
            {
                if (i + 1 < line.size() && line[i + 1] == '"')
                {
                    field.push_back('"');
                    ++i;
                }
                else
                {
                    in_quotes = false;
                }
            }
            else
            {
                field.push_back(c);
            }
        }
        else if (c == '"')
        {
            in_quotes = true;
        }
        else if (c == ',')
        {
            fields.push_back(std::move(field));
            field.clear();
        }
        else if (c != '\r')
        {
            field.push_back(c);
        }
    }
    fields.push_back(std::move(field));

    // A blank line is not a record
    if (fields.size() == 1 && fields.front().empty())
        fields.clear();
    return fields;
}

bool DictionaryStore::saveLocked(const TermList& terms, const std::string& updated_at)
{
    json grouped = json::object();
    for (auto category : kCategories)
        grouped[std::string(category)] = json::array();

    for (const auto& term : terms)
    {
        // Unknown categories are persisted under the catch-all group
        const std::string group = isKnownCategory(term.category) ? term.category : std::string(kDefaultCategory);
        grouped[group].push_back({ { "value", term.value }, { "label", term.label } });
    }

    json root = { { "version", version_ }, { "updated_at", updated_at }, { "entries", std::move(grouped) } };

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec)
    {
        last_error_ = "Failed to create dictionary directory: " + directory_ + " | " + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Dictionary, "Failed to save dictionary", last_error_);
        return false;
    }

    const std::string tmp = file_path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            last_error_ = "Could not create temporary file for writing: " + tmp;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Dictionary, "Failed to save dictionary",
                                              last_error_);
            return false;
        }
        ofs << root.dump(2);
        if (!ofs.good())
        {
            last_error_ = "Error writing dictionary file: " + tmp;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Dictionary, "Failed to save dictionary",
                                              last_error_);
            return false;
        }
    }

    fs::rename(tmp, file_path_, ec);
    if (ec)
    {
        last_error_ = "Failed to replace dictionary file: " + file_path_ + " | " + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Dictionary, "Failed to save dictionary", last_error_);
        return false;
    }

    last_error_.clear();
    return true;
}

bool DictionaryStore::containsValue(const TermList& terms, const std::string& value)
{
    for (const auto& term : terms)
    {
        if (term.value == value)
            return true;
    }
    return false;
}

std::string DictionaryStore::nowIso8601()
{
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

} // namespace dictionary
