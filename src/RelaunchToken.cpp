#include "RelaunchToken.hpp"
#include "Logger.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>
#include <unistd.h>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <map>
#include <mutex>
#include <sstream>

extern char** environ;

static std::mutex                         g_tokenMutex;
static std::map<std::string, std::string> g_inherited;

static std::string toHex(const unsigned char* data, size_t n) {
    std::ostringstream out;
    for (size_t i = 0; i < n; ++i)
        out << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    return out.str();
}

std::string RelaunchToken::generate() {
    std::ostringstream seed;
    seed << getpid() << ':' << getppid() << ':'
         << std::chrono::steady_clock::now().time_since_epoch().count() << ':';

    unsigned char salt[16];
    if (RAND_bytes(salt, sizeof(salt)) == 1) {
        seed << toHex(salt, sizeof(salt));
    } else {
        // без соли значение всё равно уникально в пределах машины
        Logger::warn("RelaunchToken: RAND_bytes failed, token is pid/time based");
    }

    std::string s = seed.str();
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(s.data()), s.size(), hash);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

std::string RelaunchToken::inherited(const std::string& key) {
    std::lock_guard<std::mutex> lk(g_tokenMutex);
    auto it = g_inherited.find(key);
    if (it != g_inherited.end())
        return it->second;

    const char* v = std::getenv(key.c_str());
    std::string value = v ? v : "";
    g_inherited.emplace(key, value);
    return value;
}

std::vector<std::string> RelaunchToken::childEnvironment(const std::string& key, const std::string& value) {
    std::vector<std::string> env;
    const std::string prefix = key + "=";
    for (char** e = environ; e && *e; ++e) {
        if (std::string(*e).rfind(prefix, 0) == 0)
            continue;
        env.emplace_back(*e);
    }
    env.push_back(prefix + value);
    return env;
}
