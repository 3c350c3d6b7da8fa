/**
 * @file TestHelpers.hpp
 * @brief Common utilities for unit tests (temp paths, env guards, photo builders, Qt context).
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <QCoreApplication>
#include "Photo.hpp"

/**
 * @brief Build a unique token string with the given prefix.
 * @param prefix Prefix to include in the token.
 * @return Unique token string that is safe for filenames.
 */
inline std::string make_unique_token(std::string_view prefix) {
    static std::atomic<uint64_t> counter{0};
    const uint64_t value = counter.fetch_add(1, std::memory_order_relaxed);
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return std::string(prefix) + std::to_string(now) + "-" + std::to_string(value);
}

/**
 * @brief RAII helper that sets and restores environment variables.
 */
class EnvVarGuard {
public:
    /**
     * @brief Set or unset an environment variable for the guard lifetime.
     * @param key Environment variable name.
     * @param value New value; unset when std::nullopt.
     */
    EnvVarGuard(std::string key, std::optional<std::string> value)
        : key_(std::move(key)) {
        if (const char* existing = std::getenv(key_.c_str())) {
            original_ = existing;
        }
        apply(value);
    }

    /**
     * @brief Restore the original environment variable state.
     */
    ~EnvVarGuard() {
        apply(original_);
    }

    EnvVarGuard(const EnvVarGuard&) = delete;
    EnvVarGuard& operator=(const EnvVarGuard&) = delete;

private:
    static void set_env(const std::string& key, const std::string& value) {
#ifdef _WIN32
        _putenv_s(key.c_str(), value.c_str());
#else
        setenv(key.c_str(), value.c_str(), 1);
#endif
    }

    static void unset_env(const std::string& key) {
#ifdef _WIN32
        _putenv_s(key.c_str(), "");
#else
        unsetenv(key.c_str());
#endif
    }

    void apply(const std::optional<std::string>& value) {
        if (value.has_value()) {
            set_env(key_, *value);
        } else {
            unset_env(key_);
        }
    }

    std::string key_;
    std::optional<std::string> original_;
};

/**
 * @brief Creates a temporary directory and cleans it up on destruction.
 */
class TempDir {
public:
    /**
     * @brief Create a unique temporary directory.
     */
    TempDir()
        : path_(std::filesystem::temp_directory_path() /
                make_unique_token("photo-renamer-test-")) {
        std::filesystem::create_directories(path_);
    }

    /**
     * @brief Remove the temporary directory and its contents.
     */
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    /**
     * @brief Return the temporary directory path.
     * @return Reference to the directory path.
     */
    const std::filesystem::path& path() const { return path_; }

    /**
     * @brief Write a file below the directory.
     * @param name File name relative to the directory.
     * @param contents Text to write.
     * @return Full path of the written file.
     */
    std::filesystem::path write_file(const std::string& name, const std::string& contents) const {
        const auto file = path_ / name;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << contents;
        return file;
    }

private:
    std::filesystem::path path_;
};

/**
 * @brief Build an album from descriptions, one photo per entry.
 */
inline std::vector<Photo> make_photos(const std::vector<std::string>& descriptions) {
    std::vector<Photo> photos;
    photos.reserve(descriptions.size());
    for (std::size_t i = 0; i < descriptions.size(); ++i) {
        photos.emplace_back("https://example.com/photo/" + std::to_string(i) + ".jpg",
                            descriptions[i], "2014-05-0" + std::to_string(i % 9 + 1));
    }
    return photos;
}

/**
 * @brief Ensures a QCoreApplication exists for timers and standard paths.
 */
class QtCoreContext {
public:
    QtCoreContext() {
        if (!QCoreApplication::instance()) {
            static int argc = 1;
            static char arg0[] = "tests";
            static char* argv[] = {arg0, nullptr};
            static QCoreApplication* app = new QCoreApplication(argc, argv);
            Q_UNUSED(app);
        }
    }
};
