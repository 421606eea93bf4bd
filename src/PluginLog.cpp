#include "PluginLog.h"

#include <fstream>
#include <ctime>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <sys/stat.h>

#ifdef _WIN32
#include <direct.h>
#include <windows.h>
#endif

#ifdef _WIN32
// Convert UTF-8 std::string to std::wstring
static std::wstring utf8ToWide(const std::string& utf8) {
    if (utf8.empty()) return {};
    int wlen = MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), -1, nullptr, 0);
    if (wlen <= 0) return {};
    std::wstring wstr(wlen, L'\0');
    int ret = MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), -1, &wstr[0], wlen);
    if (ret <= 0) return {};
    if (!wstr.empty() && wstr.back() == L'\0') wstr.pop_back();
    return wstr;
}
#endif

namespace PluginLog {

static std::mutex sMutex;
static std::string sLogPath;
static bool sFileOk = false;
static DisplaySink sSink;

static const int64_t kRotateBytes = 10 * 1024 * 1024;

static std::string getTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm;
#ifdef _WIN32
    localtime_s(&tm, &now);
#else
    localtime_r(&now, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

static int64_t fileSizeBytes(const std::string& path) {
    if (path.empty()) return -1;
#ifdef _WIN32
    struct _stat st;
    if (_wstat(utf8ToWide(path).c_str(), &st) != 0) return -1;
    return static_cast<int64_t>(st.st_size);
#else
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return -1;
    return static_cast<int64_t>(st.st_size);
#endif
}

static void ensureDir(const std::string& dir) {
#ifdef _WIN32
    _wmkdir(utf8ToWide(dir).c_str());
#else
    mkdir(dir.c_str(), 0755);
#endif
}

static bool dirExists(const std::string& dir) {
#ifdef _WIN32
    struct _stat st;
    return (_wstat(utf8ToWide(dir).c_str(), &st) == 0 && (st.st_mode & S_IFDIR));
#else
    struct stat st;
    return (stat(dir.c_str(), &st) == 0 && (st.st_mode & S_IFDIR));
#endif
}

static void rotateIfNeeded() {
    if (sLogPath.empty()) return;
    if (fileSizeBytes(sLogPath) <= kRotateBytes) return;
#ifdef _WIN32
    std::wstring wpath = utf8ToWide(sLogPath);
    std::wstring wbak = utf8ToWide(sLogPath + ".bak");
    _wremove(wbak.c_str());
    _wrename(wpath.c_str(), wbak.c_str());
#else
    std::string bak = sLogPath + ".bak";
    std::remove(bak.c_str());
    std::rename(sLogPath.c_str(), bak.c_str());
#endif
}

// Open ofstream with UTF-8 path (MSVC supports wstring constructor)
static std::ofstream openLog(const std::string& path, std::ios_base::openmode mode) {
#ifdef _WIN32
    return std::ofstream(utf8ToWide(path), mode);
#else
    return std::ofstream(path, mode);
#endif
}

void setDisplaySink(DisplaySink sink) {
    std::lock_guard<std::mutex> lock(sMutex);
    sSink = std::move(sink);
}

bool init(const std::string& dirIn) {
    std::lock_guard<std::mutex> lock(sMutex);
    sFileOk = false;
    sLogPath.clear();

    std::string dir = dirIn;
    if (dir.empty()) return false;
    while (dir.size() > 1 && (dir.back() == '/' || dir.back() == '\\'))
        dir.pop_back();

    ensureDir(dir);
    if (!dirExists(dir)) return false;

    sLogPath = dir + "/OutfitRig.log";
    rotateIfNeeded();

    const int64_t priorSize = fileSizeBytes(sLogPath);
    std::ofstream ofs = openLog(sLogPath, std::ios::app | std::ios::binary);
    if (!ofs.is_open()) {
        sLogPath.clear();
        return false;
    }

    sFileOk = true;
    if (priorSize <= 0) {
        // Help common Windows editors auto-detect UTF-8.
        ofs << "\xEF\xBB\xBF";
    }
    ofs << "\n========================================\n"
        << "  OutfitRig Session Start: " << getTimestamp() << "\n"
        << "  Log path: " << sLogPath << "\n"
        << "========================================\n";
    return true;
}

std::string logPath() {
    std::lock_guard<std::mutex> lock(sMutex);
    return sFileOk ? sLogPath : std::string();
}

void logBlock(const std::string& title,
              const std::vector<std::pair<std::string, std::string>>& rows) {
    std::lock_guard<std::mutex> lock(sMutex);
    if (!sFileOk) return;

    std::ofstream ofs = openLog(sLogPath, std::ios::app);
    if (!ofs.is_open()) return;

    ofs << "--- " << title << " ---\n";
    for (const auto& row : rows) {
        std::string key = row.first;
        if (key.size() < 12) key.append(12 - key.size(), ' ');
        ofs << "  " << key << " : " << row.second << "\n";
    }
    ofs << "-------------------\n";
}

void logSummary(const OperationSummary& summary) {
    std::lock_guard<std::mutex> lock(sMutex);
    if (!sFileOk) return;

    std::ofstream ofs = openLog(sLogPath, std::ios::app);
    if (!ofs.is_open()) return;

    ofs << "\n--- Operation Summary [" << summary.module << "] " << getTimestamp() << " ---\n";
    if (!summary.object.empty()) {
        ofs << "  Object   : " << summary.object << "\n";
    }
    ofs << "  Status   : " << summary.status << "\n";
    ofs << "  Affected : " << summary.affected << "\n";
    if (summary.failed > 0) {
        ofs << "  Failed   : " << summary.failed << "\n";
    }
    for (const auto& note : summary.notes) {
        ofs << "  * " << note << "\n";
    }
    ofs << "--- End Summary ---\n";
}

void shutdown() {
    std::lock_guard<std::mutex> lock(sMutex);
    if (!sFileOk) return;

    std::ofstream ofs = openLog(sLogPath, std::ios::app);
    if (ofs.is_open()) {
        ofs << "[" << getTimestamp() << "][Info][Plugin] Session end.\n";
    }
    sFileOk = false;
}

std::string formatLine(const char* level, const char* module, const std::string& msg) {
    return "[" + getTimestamp() + "][" + level + "][" + module + "] " + msg;
}

static void write(Level level, const char* levelName, const char* module, const std::string& msg) {
    std::lock_guard<std::mutex> lock(sMutex);
    if (sSink) {
        sSink(level, std::string("[") + module + "] " + msg);
    }
    if (!sFileOk) return;

    std::ofstream ofs = openLog(sLogPath, std::ios::app);
    if (ofs.is_open()) {
        ofs << formatLine(levelName, module, msg) << "\n";
    }
}

void info(const char* module, const std::string& msg) {
    write(Level::Info, "Info", module, msg);
}

void warn(const char* module, const std::string& msg) {
    write(Level::Warn, "Warn", module, msg);
}

void error(const char* module, const std::string& msg) {
    write(Level::Error, "Error", module, msg);
}

} // namespace PluginLog
