#include "synthflat/metadata/analysis.hpp"
#include "synthflat/core/errors.hpp"
#include "synthflat/core/utils.hpp"
#include "synthflat/io/raw_decoder.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iomanip>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <thread>

namespace synthflat::metadata {

std::vector<MetadataMap> collect_metadata(const io::FrameDecoder& decoder,
                                          const std::vector<fs::path>& files, int workers,
                                          std::vector<std::string>* skipped) {
    const size_t n = files.size();
    std::vector<std::optional<MetadataMap>> slots(n);
    std::vector<std::string> skip_reasons(n);

    std::atomic<size_t> next{0};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    auto worker = [&]() {
        while (true) {
            const size_t i = next.fetch_add(1);
            if (i >= n) break;
            try {
                slots[i] = decoder.read_metadata(files[i]);
            } catch (const IOError& e) {
                skip_reasons[i] = files[i].filename().string() + ": " + e.what();
            } catch (const std::exception&) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) first_error = std::current_exception();
            }
        }
    };

    const size_t count = std::min(n, static_cast<size_t>(std::max(1, workers)));
    std::vector<std::thread> pool;
    pool.reserve(count);
    for (size_t i = 0; i < count; ++i) pool.emplace_back(worker);
    for (auto& t : pool) t.join();
    if (first_error) std::rethrow_exception(first_error);

    std::vector<MetadataMap> batch;
    batch.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (slots[i]) {
            batch.push_back(std::move(*slots[i]));
        } else if (skipped) {
            skipped->push_back(skip_reasons[i]);
        }
    }
    return batch;
}

MetadataReport analyze_metadata(const std::vector<MetadataMap>& batch) {
    std::map<std::string, std::set<std::string>> distinct;
    std::map<std::string, size_t> present;
    for (const auto& frame : batch) {
        for (const auto& [field, value] : frame) {
            distinct[field].insert(value);
            ++present[field];
        }
    }

    MetadataReport report;
    for (const auto& [field, values] : distinct) {
        FieldStats stats;
        stats.values.assign(values.begin(), values.end());
        stats.missing_count = batch.size() - present[field];
        report.emplace(field, std::move(stats));
    }
    return report;
}

nlohmann::json report_to_json(const MetadataReport& report) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [field, stats] : report) {
        j[field] = {
            {"distinct_values_count", stats.values.size()},
            {"values", stats.values},
            {"missing_count", stats.missing_count}
        };
    }
    return j;
}

MetadataReport report_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ValidationError("metadata report must be a JSON object");
    }

    MetadataReport report;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& entry = it.value();
        if (!entry.is_object() || !entry.contains("values") || !entry["values"].is_array()) {
            throw ValidationError("metadata report entry '" + it.key() + "' has no values array");
        }
        FieldStats stats;
        for (const auto& v : entry["values"]) {
            stats.values.push_back(v.is_string() ? v.get<std::string>() : v.dump());
        }
        std::sort(stats.values.begin(), stats.values.end());
        stats.values.erase(std::unique(stats.values.begin(), stats.values.end()), stats.values.end());
        stats.missing_count = entry.value("missing_count", static_cast<size_t>(0));
        report.emplace(it.key(), std::move(stats));
    }
    return report;
}

void write_report(const fs::path& path, const MetadataReport& report) {
    core::write_text(path, report_to_json(report).dump(2) + "\n");
}

MetadataReport read_report(const fs::path& path) {
    const std::string text = core::read_text(path);
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError(path.string() + ": " + e.what());
    }
    return report_from_json(j);
}

std::string summarize_report(const MetadataReport& report) {
    size_t field_w = 5;
    for (const auto& [field, stats] : report) {
        field_w = std::max(field_w, field.size());
    }

    std::ostringstream oss;
    oss << std::left << std::setw(static_cast<int>(field_w)) << "Field" << "  "
        << std::setw(8) << "Distinct" << "  " << "Value" << "\n";
    oss << std::string(field_w, '-') << "  " << std::string(8, '-') << "  "
        << std::string(5, '-') << "\n";

    for (const auto& [field, stats] : report) {
        std::string value = stats.values.size() == 1 ? stats.values.front() : "multiple";
        if (stats.missing_count > 0) {
            value += " (missing in " + std::to_string(stats.missing_count) + ")";
        }
        oss << std::setw(static_cast<int>(field_w)) << field << "  "
            << std::setw(8) << stats.values.size() << "  " << value << "\n";
    }
    return oss.str();
}

} // namespace synthflat::metadata
