#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// libcurl transport for manifests and package archives. Handles http(s) and
// file:// URLs; an optional proxy applies to every request.
class Downloader {
public:
    explicit Downloader(std::string proxy_server = "", int max_retries = 3);

    // Writes the body of url to output_path. A failed or cancelled transfer
    // removes output_path. Throws DownloadError or Cancelled.
    void download_file(const std::string& url, const fs::path& output_path, bool show_progress = true) const;
    void download_with_retries(const std::string& url, const fs::path& output_path, bool show_progress = true) const;

    // Returns the body of url. Throws DownloadError or Cancelled.
    std::string fetch_to_string(const std::string& url) const;

private:
    std::string proxy_server_;
    int max_retries_;
};

// Calls curl_global_init / curl_global_cleanup for the process lifetime.
class CurlGlobalInitializer {
public:
    CurlGlobalInitializer();
    ~CurlGlobalInitializer();
    CurlGlobalInitializer(const CurlGlobalInitializer&) = delete;
    CurlGlobalInitializer& operator=(const CurlGlobalInitializer&) = delete;
};
