#include "CrashWrap.hpp"
#include "ChildProcess.hpp"
#include "CrashDetector.hpp"
#include "FatalSignals.hpp"
#include "Logger.hpp"
#include "RelaunchToken.hpp"
#include "SignalRelay.hpp"
#include "StreamForwarder.hpp"

#include <cerrno>
#include <cstring>
#include <mutex>
#include <optional>
#include <set>
#include <utility>

static std::mutex g_payloadMutex;

// Экземпляры WrapConfig, ушедшие в ветку payload в этом процессе.
// Не разрушается: статические WrapConfig из других единиц трансляции
// могут умирать позже.
static std::set<const WrapConfig*>& payloadConfigs() {
    static auto* configs = new std::set<const WrapConfig*>();
    return *configs;
}

static void markPayload(const WrapConfig* config) {
    std::lock_guard<std::mutex> lk(g_payloadMutex);
    payloadConfigs().insert(config);
}

WrapConfig::~WrapConfig() {
    std::lock_guard<std::mutex> lk(g_payloadMutex);
    payloadConfigs().erase(this);
}

bool wrapped(const WrapConfig* config) {
    if (!config)
        return RelaunchToken::present(RelaunchToken::kDefaultKey);
    std::lock_guard<std::mutex> lk(g_payloadMutex);
    return payloadConfigs().count(config) != 0;
}

static WrapResult spawnError(const std::string& msg) {
    Logger::error("wrap: %s", msg.c_str());
    WrapResult res;
    res.role    = WrapRole::Supervisor;
    res.done    = false;
    res.error   = WrapError::Spawn;
    res.message = msg;
    return res;
}

WrapResult wrap(const WrapConfig& config) {
    WrapResult res;
    if (!config.handler) {
        res.error   = WrapError::Config;
        res.message = "crash handler is not set";
        return res;
    }

    if (RelaunchToken::present(config.tokenKey)) {
        markPayload(&config);
        if (config.installSignalHandlers)
            installFatalSignalHandlers();
        res.role = WrapRole::Payload;
        res.done = false;
        return res;
    }

    std::string err;
    std::string exe = config.executable;
    if (exe.empty() && !ChildProcess::selfExecutable(exe, err))
        return spawnError(err);

    std::vector<std::string> args = config.args;
    if (args.empty() && !ChildProcess::selfArguments(args, err))
        return spawnError(err);

    auto env = RelaunchToken::childEnvironment(config.tokenKey, RelaunchToken::generate());

    // маска ставится до создания потоков, они её наследуют
    SignalRelay relay(config.forwardSignals, config.ignoreSignals);
    relay.block();

    SpawnedChild child;
    if (!ChildProcess::spawn(exe, args, env, relay.handled(), child, err)) {
        relay.stop();
        return spawnError(err);
    }
    Logger::debug("wrap: supervising %s as pid %d", exe.c_str(), (int)child.pid);

    StreamForwarder forwarder(config.stdoutFd, config.stderrFd,
                              CrashDetector(config.signatures, config.patience, config.quietPeriod));
    forwarder.start(child.outFd, child.errFd);
    relay.start(child.pid);

    forwarder.join();

    // реле останавливается, пока ребёнок ещё зомби: kill() не уйдёт чужому pid
    bool exited = ChildProcess::waitExited(child.pid, err);
    relay.stop();

    int status = -1;
    bool waited = exited && ChildProcess::wait(child.pid, status, err);

    res.role = WrapRole::Supervisor;
    res.done = true;

    std::optional<std::string> capture = forwarder.takeCapture();
    {
        // stderr может оказаться пайпом без читателя: EPIPE вместо смерти до handler
        SigpipeGuard pipeGuard;

        if (waited) {
            res.exitStatus = status;
        } else {
            Logger::error("wrap: %s", err.c_str());
            res.exitStatus = -1;
            res.error      = WrapError::Wait;
            res.message    = err;
        }

        std::string streamErr = forwarder.error();
        if (!streamErr.empty() && res.error == WrapError::None) {
            res.error   = WrapError::Stream;
            res.message = streamErr;
        }

        if (capture) {
            Logger::debug("wrap: crash captured (%zu bytes)", capture->size());
            if (!config.hideCapture &&
                !StreamForwarder::writeAll(config.stderrFd, capture->data(), capture->size())) {
                std::string msg = std::string("cannot write captured dump to stderr: ") + std::strerror(errno);
                Logger::warn("wrap: %s", msg.c_str());
                if (res.error == WrapError::None) {
                    res.error   = WrapError::Stream;
                    res.message = msg;
                }
            }
        }
    }

    if (capture)
        config.handler(*capture);
    return res;
}

WrapResult basicWrap(CrashHandler handler) {
    static WrapConfig config;
    config.handler = std::move(handler);
    return wrap(config);
}
