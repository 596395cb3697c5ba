#include "CrashReporter.hpp"
#include "Logger.hpp"

#include <curl/curl.h>
#include <openssl/sha.h>
#include <fstream>
#include <iomanip>
#include <sstream>

// Инициализация/очистка libcurl (глобально)
CrashReporter::CrashReporter(const std::string& url, const std::string& crashDir)
  : url_(url)
  , crashDir_(crashDir)
{
    curl_global_init(CURL_GLOBAL_ALL);
}

CrashReporter::~CrashReporter() {
    curl_global_cleanup();
}

std::string CrashReporter::fingerprint(const std::string& capture) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(capture.data()), capture.size(), hash);

    std::ostringstream hashStr;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i)
        hashStr << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    return hashStr.str();
}

bool CrashReporter::saveToDir(const std::string& capture, std::string& path) {
    path = crashDir_ + "/crash-" + fingerprint(capture) + ".txt";
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        Logger::error("CrashReporter: cannot open %s", path.c_str());
        return false;
    }
    out.write(capture.data(), std::streamsize(capture.size()));
    out.flush();
    if (!out) {
        Logger::error("CrashReporter: write to %s failed", path.c_str());
        return false;
    }
    return true;
}

// Тело ответа сервера не нужно, только для логов
size_t CrashReporter::writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

bool CrashReporter::submit(const std::string& capture, long& httpCode) {
    httpCode = 0;
    CURL* easy = curl_easy_init();
    if (!easy) {
        Logger::error("CrashReporter: curl_easy_init failed");
        return false;
    }

    std::string fingerprintHeader = "X-Crash-Fingerprint: " + fingerprint(capture);
    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: text/plain; charset=utf-8");
    headers = curl_slist_append(headers, fingerprintHeader.c_str());

    std::string body;
    curl_easy_setopt(easy, CURLOPT_URL,            url_.c_str());
    curl_easy_setopt(easy, CURLOPT_POST,           1L);
    curl_easy_setopt(easy, CURLOPT_POSTFIELDS,     capture.data());
    curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE,  (long)capture.size());
    curl_easy_setopt(easy, CURLOPT_HTTPHEADER,     headers);
    curl_easy_setopt(easy, CURLOPT_USERAGENT,      "crashwrap/1.0");
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION,  writeCallback);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA,      &body);
    curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy, CURLOPT_TIMEOUT,        20L);
    curl_easy_setopt(easy, CURLOPT_NOSIGNAL,       1L);

    CURLcode res = curl_easy_perform(easy);
    if (res == CURLE_OK)
        curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &httpCode);

    curl_slist_free_all(headers);
    curl_easy_cleanup(easy);

    if (res != CURLE_OK) {
        Logger::error("CrashReporter: POST %s failed: %s", url_.c_str(), curl_easy_strerror(res));
        return false;
    }
    Logger::debug("CrashReporter: POST %s -> %ld (%zu bytes of response)", url_.c_str(), httpCode, body.size());
    return httpCode >= 200 && httpCode < 300;
}

CrashHandler CrashReporter::handler() {
    return [this](const std::string& capture) {
        if (!crashDir_.empty()) {
            std::string path;
            if (saveToDir(capture, path)) {
                lastSavedPath_ = path;
                Logger::info("Crash report saved to %s", path.c_str());
            }
        }
        if (!url_.empty()) {
            long code = 0;
            if (submit(capture, code))
                Logger::info("Crash report sent to %s", url_.c_str());
            else
                Logger::warn("Crash report was not accepted by %s (HTTP %ld)", url_.c_str(), code);
        }
    };
}
