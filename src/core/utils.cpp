#include "synthflat/core/utils.hpp"
#include "synthflat/core/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <random>
#include <regex>
#include <sstream>

#include <openssl/evp.h>
#include <openssl/sha.h>

namespace synthflat::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }
    return oss.str();
}

std::vector<fs::path> discover_frames(const fs::path& input_dir, const std::string& pattern) {
    if (!fs::exists(input_dir) || !fs::is_directory(input_dir)) {
        throw IOError("Input directory not found: " + input_dir.string());
    }

    std::vector<fs::path> frames;
    for (const auto& entry : fs::directory_iterator(input_dir)) {
        if (entry.is_regular_file() &&
            glob_match(pattern, entry.path().filename().string())) {
            frames.push_back(entry.path());
        }
    }

    std::sort(frames.begin(), frames.end());
    return frames;
}

std::vector<uint8_t> read_bytes(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw IOError("Not a regular file: " + path.string());
    }
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    auto size = file.tellg();
    if (size < 0) {
        throw IOError("Cannot determine size of file: " + path.string());
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw IOError("Cannot read file: " + path.string());
    }
    return buffer;
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
    if (!file) {
        throw IOError("Cannot write file: " + path.string());
    }
}

fs::path temp_sibling(const fs::path& target, const std::string& run_id) {
    fs::path tmp = target;
    tmp += ".tmp-" + run_id;
    return tmp;
}

void commit_temp_file(const fs::path& tmp, const fs::path& target) {
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        remove_quietly(tmp);
        throw IOError("Cannot rename " + tmp.string() + " -> " + target.string() +
                      ": " + ec.message());
    }
}

void remove_quietly(const fs::path& path) noexcept {
    std::error_code ec;
    fs::remove(path, ec);
}

namespace {

std::string to_hex(const unsigned char* digest, size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

struct DigestCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

std::string sha256_bytes(const std::vector<uint8_t>& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string sha256_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw IOError("Not a regular file: " + path.string());
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::unique_ptr<EVP_MD_CTX, DigestCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw IOError("SHA-256 init failed for " + path.string());
    }

    // fixed-size chunks, raw frames are not read into memory twice
    std::vector<char> chunk(1 << 20);
    while (file) {
        file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const std::streamsize got = file.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), chunk.data(), static_cast<size_t>(got)) != 1) {
            throw IOError("SHA-256 update failed for " + path.string());
        }
    }
    if (file.bad()) {
        throw IOError("Cannot read file: " + path.string());
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &len) != 1) {
        throw IOError("SHA-256 final failed for " + path.string());
    }
    return to_hex(hash, len);
}

float median_of(std::vector<float>& v) {
    if (v.empty()) return 0.0f;
    const size_t n = v.size();
    const size_t mid = n / 2;
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid), v.end());
    const float hi = v[mid];
    if ((n % 2) == 1) return hi;
    // lower middle is the max of the left partition
    const float lo = *std::max_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid));
    return 0.5f * (lo + hi);
}

float compute_percentile(std::vector<float> values, float percentile) {
    if (values.empty()) return 0.0f;
    std::sort(values.begin(), values.end());

    float clamped = std::min(std::max(percentile, 0.0f), 100.0f);
    float idx = clamped / 100.0f * static_cast<float>(values.size() - 1);
    size_t lower = static_cast<size_t>(idx);
    size_t upper = std::min(lower + 1, values.size() - 1);
    float frac = idx - static_cast<float>(lower);

    return values[lower] * (1.0f - frac) + values[upper] * frac;
}

double round_half_even(double value) {
    return std::nearbyint(value);
}

uint16_t quantize_sample(double value, uint16_t max_value) {
    if (!std::isfinite(value) || value <= 0.0) return 0;
    double r = round_half_even(value);
    if (r >= static_cast<double>(max_value)) return max_value;
    return static_cast<uint16_t>(r);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::vector<std::string> split_ws(const std::string& str) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (iss >> part) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << delimiter;
        oss << parts[i];
    }
    return oss.str();
}

bool glob_match(const std::string& pattern, const std::string& str) {
    std::string regex_pattern;
    for (char c : pattern) {
        switch (c) {
            case '*': regex_pattern += ".*"; break;
            case '?': regex_pattern += "."; break;
            case '.': case '(': case ')': case '+': case '^': case '$':
            case '|': case '{': case '}': case '\\':
                regex_pattern += '\\';
                regex_pattern += c;
                break;
            default: regex_pattern += c; break;
        }
    }

    std::regex re(regex_pattern, std::regex::icase);
    return std::regex_match(str, re);
}

} // namespace synthflat::core
