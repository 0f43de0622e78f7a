#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <unistd.h>

namespace {

size_t write_to_stream(void* ptr, size_t size, size_t nmemb, void* stream) {
    std::ostream* out = static_cast<std::ostream*>(stream);
    size_t bytes = size * nmemb;
    out->write(static_cast<char*>(ptr), static_cast<std::streamsize>(bytes));
    return out->good() ? bytes : 0;
}

size_t write_to_string(void* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = static_cast<std::string*>(userdata);
    size_t bytes = size * nmemb;
    out->append(static_cast<char*>(ptr), bytes);
    return bytes;
}

struct ProgressState {
    bool show = false;
    std::string label;
};

// Returning non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, [[maybe_unused]] curl_off_t ultotal, [[maybe_unused]] curl_off_t ulnow) {
    if (cancellation_requested()) {
        return 1;
    }
    const auto* state = static_cast<const ProgressState*>(clientp);
    if (!state->show || dltotal <= 0) {
        return 0;
    }
    double percentage = static_cast<double>(dlnow) / static_cast<double>(dltotal) * 100.0;
    log_progress(state->label, percentage);
    return 0;
}

// Custom deleter for the CURL handle
struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

CurlHandle make_handle(const std::string& url, const std::string& proxy, ProgressState& progress) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw GoogetException(string_format("error.download_failed", url, "curl_easy_init"), ErrorKind::DownloadError);
    }
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "googet");
    if (!proxy.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_PROXY, proxy.c_str());
    }
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &progress);
    return curl;
}

void check_result(CURLcode res, const std::string& url) {
    if (res == CURLE_OK) return;
    if (res == CURLE_ABORTED_BY_CALLBACK && cancellation_requested()) {
        throw GoogetException(string_format("error.download_cancelled", url), ErrorKind::Cancelled);
    }
    throw GoogetException(string_format("error.download_failed", url, curl_easy_strerror(res)), ErrorKind::DownloadError);
}

} // anonymous namespace

Downloader::Downloader(std::string proxy_server, int max_retries)
    : proxy_server_(std::move(proxy_server)), max_retries_(max_retries < 1 ? 1 : max_retries) {}

void Downloader::download_file(const std::string& url, const fs::path& output_path, bool show_progress) const {
    if (cancellation_requested()) {
        throw GoogetException(string_format("error.download_cancelled", url), ErrorKind::Cancelled);
    }
    ProgressState progress{show_progress && isatty(STDOUT_FILENO), string_format("info.downloading", url)};
    CurlHandle curl = make_handle(url, proxy_server_, progress);

    CURLcode res;
    {
        std::ofstream ofile(output_path, std::ios::binary | std::ios::trunc);
        if (!ofile) {
            throw GoogetException(string_format("error.create_file_failed", output_path.string()), ErrorKind::Io);
        }
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_stream);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ofile);
        res = curl_easy_perform(curl.get());
    }
    if (progress.show) {
        std::cout << std::endl;
    }

    if (res != CURLE_OK) {
        std::error_code ec;
        fs::remove(output_path, ec);
        check_result(res, url);
    }
}

void Downloader::download_with_retries(const std::string& url, const fs::path& output_path, bool show_progress) const {
    for (int i = 0; i < max_retries_; ++i) {
        try {
            download_file(url, output_path, show_progress);
            return; // Success
        } catch (const GoogetException& e) {
            if (e.kind() == ErrorKind::Cancelled || i == max_retries_ - 1) {
                throw;
            }
            log_warning(string_format("warning.download_retry", e.what()));
        }
    }
}

std::string Downloader::fetch_to_string(const std::string& url) const {
    ProgressState progress;
    CurlHandle curl = make_handle(url, proxy_server_, progress);

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    check_result(curl_easy_perform(curl.get()), url);
    return body;
}

CurlGlobalInitializer::CurlGlobalInitializer() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlGlobalInitializer::~CurlGlobalInitializer() {
    curl_global_cleanup();
}
