#include "utils.h"
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <iterator>
#include <unistd.h>
#include <sys/wait.h>

namespace autorun {
namespace utils {

std::string formatTimestampMs(const std::chrono::system_clock::time_point &ts)
{
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(ts);
    std::time_t t = std::chrono::system_clock::to_time_t(seconds);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()) % 1000;

    std::tm buf {};
    localtime_r(&t, &buf);

    std::ostringstream oss;
    oss << std::put_time(&buf, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string trim(const std::string &str) {
    const char* ws = " \t\r\n";
    const auto begin = str.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    const auto end = str.find_last_not_of(ws);
    return str.substr(begin, end - begin + 1);
}

std::vector<std::string> split(const std::string &str, char delim) {
    std::vector<std::string> out;
    std::string cur;
    std::istringstream iss(str);
    while (std::getline(iss, cur, delim)) {
        out.push_back(cur);
    }
    // "a," 这种末尾分隔符，getline 不会给出最后的空串
    if (!str.empty() && str.back() == delim) {
        out.emplace_back();
    }
    return out;
}

bool starts_with(const std::string &str, const std::string &prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

std::optional<std::string> read_file(const std::string &path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) return std::nullopt;
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) return std::nullopt;
    return content;
}

bool write_file(const std::string &path, const std::string &content) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) return false;
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    ofs.flush();
    return ofs.good();
}

ExecResult exec_command(const std::vector<std::string> &args) {
    ExecResult r;
    if (args.empty()) {
        r.output = "empty command";
        return r;
    }

    int outPipe[2]{-1, -1};
    if (::pipe(outPipe) != 0) {
        r.output = std::string("pipe() failed: ") + std::strerror(errno);
        return r;
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        r.output = std::string("fork() failed: ") + std::strerror(errno);
        return r;
    }

    if (pid == 0) {
        // ---- child ----
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(outPipe[1], STDERR_FILENO);
        ::close(outPipe[0]);
        ::close(outPipe[1]);

        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
        argv.push_back(nullptr);

        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    // ---- parent ----
    ::close(outPipe[1]);
    char buf[4096];
    while (true) {
        const ssize_t n = ::read(outPipe[0], buf, sizeof(buf));
        if (n > 0) {
            r.output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    ::close(outPipe[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            r.exit_code = -1;
            return r;
        }
    }

    if (WIFEXITED(status)) {
        r.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        r.exit_code = 128 + WTERMSIG(status);
    } else {
        r.exit_code = status;
    }
    return r;
}

std::string join_command(const std::vector<std::string> &args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

} // namespace utils
} // namespace autorun
