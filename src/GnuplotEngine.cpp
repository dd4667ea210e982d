#include "GnuplotEngine.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {
std::string normalizePlotLabel(const std::string& label, size_t maxLen = 18) {
    std::string out;
    out.reserve(label.size());
    for (char ch : label) {
        const unsigned char uc = static_cast<unsigned char>(ch);
        if (ch == '_' || uc < 32 || uc > 126) {
            if (!out.empty() && out.back() != ' ') out.push_back(' ');
        } else {
            out.push_back(ch);
        }
    }
    out = CommonUtils::trim(out);
    if (out.empty()) out = "Unnamed";
    if (out.size() > maxLen) out = out.substr(0, maxLen - 3) + "...";
    return out;
}

// Searches each PATH entry in order; an empty entry means the working directory.
std::string findExecutableInPath(const std::string& command) {
    const char* pathEnv = std::getenv("PATH");
    if (command.empty() || pathEnv == nullptr) return "";

    const std::string path(pathEnv);
    size_t begin = 0;
    while (begin <= path.size()) {
        size_t end = path.find(':', begin);
        if (end == std::string::npos) end = path.size();
        const std::string dir = end > begin ? path.substr(begin, end - begin) : std::string(".");
        const std::filesystem::path candidate = std::filesystem::path(dir) / command;
        if (::access(candidate.c_str(), X_OK) == 0) {
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec)) return candidate.string();
        }
        begin = end + 1;
    }
    return "";
}

// Data files only understand double-quoted strings.
std::string quoteDataField(const std::string& value) {
    std::string out = value;
    std::replace(out.begin(), out.end(), '"', '\'');
    return "\"" + out + "\"";
}

struct ChartFiles {
    std::string data;
    std::string script;
    std::string image;
    std::string log;
};

bool writeTextFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out << content;
    return out.good();
}

void removeQuietly(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

// Runs `gnuplot <script>` with stderr redirected into the chart's log file.
// Returns the exit status, or -1 when the process could not be started or was killed.
int runGnuplot(const std::string& executable, const ChartFiles& files) {
    const int logFd = ::open(files.log.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (logFd < 0) return -1;

    posix_spawn_file_actions_t actions;
    if (::posix_spawn_file_actions_init(&actions) != 0) {
        ::close(logFd);
        return -1;
    }

    pid_t pid = -1;
    int spawnRc = ::posix_spawn_file_actions_adddup2(&actions, logFd, STDERR_FILENO);
    if (spawnRc == 0) spawnRc = ::posix_spawn_file_actions_addclose(&actions, logFd);
    if (spawnRc == 0) {
        const char* args[] = {executable.c_str(), files.script.c_str(), nullptr};
        spawnRc = ::posix_spawn(&pid, executable.c_str(), &actions, nullptr, const_cast<char* const*>(args), environ);
    }
    ::posix_spawn_file_actions_destroy(&actions);
    ::close(logFd);
    if (spawnRc != 0 || pid <= 0) return -1;

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

std::string firstLineOf(const std::string& path) {
    std::ifstream in(path);
    std::string line;
    std::getline(in, line);
    return CommonUtils::trim(line);
}

double freedmanDiaconisWidth(const std::vector<double>& sorted) {
    const double n = static_cast<double>(sorted.size());
    const double iqr = CommonUtils::quantileByNth(sorted, 0.75) - CommonUtils::quantileByNth(sorted, 0.25);
    if (iqr > 1e-12) return 2.0 * iqr * std::pow(n, -1.0 / 3.0);
    const double range = sorted.back() - sorted.front();
    const double sturgesBins = std::ceil(std::log2(n) + 1.0);
    return range / std::max(1.0, sturgesBins);
}
} // namespace

std::string GnuplotEngine::sanitizeId(const std::string& id) {
    std::string out = id;
    std::replace_if(out.begin(), out.end(), [](unsigned char c) {
        return !(std::isalnum(c) || c == '_' || c == '-');
    }, '_');
    if (out.empty()) out = "plot";
    return out;
}

std::string GnuplotEngine::quoteForGnuplot(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 2);
    escaped.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            escaped += "''";
        } else {
            escaped.push_back(ch);
        }
    }
    escaped.push_back('\'');
    return escaped;
}

std::string GnuplotEngine::terminalForFormat(const std::string& format, int width, int height) {
    if (format == "svg") return "svg size " + std::to_string(width) + "," + std::to_string(height);
    return "pngcairo size " + std::to_string(width) + "," + std::to_string(height);
}

std::string GnuplotEngine::styledHeader(const std::string& id, const std::string& title) const {
    std::ostringstream script;
    script << "set terminal " << terminalForFormat(cfg_.format, cfg_.width, cfg_.height) << " enhanced\n";
    script << "set output " << quoteForGnuplot(assetsDir_ + "/" + sanitizeId(id) + "." + cfg_.format) << "\n";
    script << "set title " << quoteForGnuplot(title) << " font ',14'\n";
    script << "set border linewidth 1.2 lc rgb '#9ca3af'\n";
    script << "set tics textcolor rgb '#374151' font ',10'\n";
    script << "set tics out nomirror\n";
    script << "set style line 1 lc rgb '#4c72b0' lw 1.5\n";
    return script.str();
}

std::string GnuplotEngine::dataPath(const std::string& id) const {
    return assetsDir_ + "/" + sanitizeId(id) + ".dat";
}

GnuplotEngine::GnuplotEngine(std::string assetsDir, PlotConfig cfg)
    : assetsDir_(std::move(assetsDir)), cfg_(std::move(cfg)) {
    std::error_code ec;
    std::filesystem::create_directories(assetsDir_, ec);
    if (ec) {
        std::cerr << "[Cognia][Plot] Could not create assets directory '" << assetsDir_ << "': " << ec.message() << "\n";
    }
}

bool GnuplotEngine::isAvailable() const {
    return !findExecutableInPath("gnuplot").empty();
}

std::string GnuplotEngine::runScript(const std::string& id, const std::string& dataContent, const std::string& scriptContent) {
    static const std::string executable = findExecutableInPath("gnuplot");
    if (executable.empty()) return "";

    const std::string stem = assetsDir_ + "/" + sanitizeId(id);
    const ChartFiles files{dataPath(id), stem + ".plt", stem + "." + cfg_.format, stem + ".log"};

    if (!writeTextFile(files.data, dataContent) || !writeTextFile(files.script, scriptContent)) {
        std::cerr << "[Cognia][Plot] Could not write chart inputs for '" << id << "' under " << assetsDir_ << "\n";
        removeQuietly(files.data);
        removeQuietly(files.script);
        return "";
    }

    const int rc = runGnuplot(executable, files);
    removeQuietly(files.data);
    removeQuietly(files.script);

    std::error_code ec;
    const bool produced = std::filesystem::exists(files.image, ec) && !ec;
    if (rc != 0 || !produced) {
        std::cerr << "[Cognia][Plot] Chart '" << id << "' was not rendered (gnuplot exit " << rc << ")";
        const std::string reason = firstLineOf(files.log);
        if (!reason.empty()) std::cerr << ": " << reason;
        std::cerr << " [log: " << files.log << "]\n";
        return "";
    }

    removeQuietly(files.log);
    return files.image;
}

std::string GnuplotEngine::heatmap(const std::string& id,
                                   const std::vector<std::vector<double>>& matrix,
                                   const std::string& title,
                                   const std::vector<std::string>& labels,
                                   double scaleMin,
                                   double scaleMax) {
    if (matrix.empty() || matrix.front().empty()) return "";

    // Image cells are centred on integer coordinates; NaN cells are left blank.
    std::ostringstream data;
    for (size_t r = 0; r < matrix.size(); ++r) {
        for (size_t c = 0; c < matrix[r].size(); ++c) {
            data << c << " " << r << " ";
            if (std::isfinite(matrix[r][c])) {
                data << matrix[r][c];
            } else {
                data << "NaN";
            }
            data << "\n";
        }
        data << "\n";
    }

    const size_t n = matrix.size();
    std::ostringstream script;
    script << styledHeader(id, title);
    script << "unset key\nunset grid\n";
    script << "set size ratio -1\n";
    script << "set palette defined (0 '#3b4cc0', 0.5 '#dddddd', 1 '#b40426')\n";
    script << "set cbrange [" << scaleMin << ":" << scaleMax << "]\n";
    script << "set colorbox vertical\n";
    script << "set xrange [-0.5:" << (static_cast<double>(n) - 0.5) << "]\n";
    script << "set yrange [" << (static_cast<double>(n) - 0.5) << ":-0.5]\n";
    if (labels.size() == n) {
        std::ostringstream tics;
        for (size_t i = 0; i < n; ++i) {
            if (i > 0) tics << ", ";
            tics << quoteForGnuplot(normalizePlotLabel(labels[i])) << " " << i;
        }
        script << "set xtics (" << tics.str() << ") rotate by 45 right font ',9'\n";
        script << "set ytics (" << tics.str() << ") font ',9'\n";
    }
    script << "plot " << quoteForGnuplot(dataPath(id)) << " using 1:2:3 with image\n";
    return runScript(id, data.str(), script.str());
}

std::string GnuplotEngine::histogram(const std::string& id,
                                     const std::vector<double>& values,
                                     const std::string& title) {
    std::vector<double> vals;
    vals.reserve(values.size());
    for (double v : values) {
        if (std::isfinite(v)) vals.push_back(v);
    }
    if (vals.empty()) return "";
    std::sort(vals.begin(), vals.end());

    const double minV = vals.front();
    const double range = vals.back() - minV;
    size_t bins = 1;
    double binWidth = 1.0;
    if (range > 1e-12) {
        const double suggested = std::max(freedmanDiaconisWidth(vals), 1e-9);
        bins = static_cast<size_t>(std::clamp(std::ceil(range / suggested), 5.0, 60.0));
        binWidth = range / static_cast<double>(bins);
    }

    // One line per bin: centre and count. The last bin is closed on the right.
    std::vector<size_t> counts(bins, 0);
    for (double v : vals) {
        const size_t slot = static_cast<size_t>(std::floor((v - minV) / binWidth));
        ++counts[std::min(slot, bins - 1)];
    }
    std::ostringstream data;
    for (size_t b = 0; b < bins; ++b) {
        const double centre = range > 1e-12 ? minV + (static_cast<double>(b) + 0.5) * binWidth : minV;
        data << centre << " " << counts[b] << "\n";
    }

    std::ostringstream script;
    script << styledHeader(id, title);
    script << "unset key\n";
    script << "set xlabel 'Value' font ',11'\n";
    script << "set ylabel 'Frequency' font ',11'\n";
    script << "set yrange [0:*]\n";
    script << "set boxwidth " << binWidth * 0.95 << " absolute\n";
    script << "set style fill solid 0.85 border lc rgb '#000000'\n";
    script << "plot " << quoteForGnuplot(dataPath(id)) << " using 1:2 with boxes ls 1\n";
    return runScript(id, data.str(), script.str());
}

std::string GnuplotEngine::bar(const std::string& id,
                               const std::vector<std::string>& labels,
                               const std::vector<double>& values,
                               const std::string& title) {
    const size_t n = std::min(labels.size(), values.size());
    if (n == 0) return "";

    double maxValue = 0.0;
    std::ostringstream data;
    for (size_t i = 0; i < n; ++i) {
        data << i << " " << values[i] << " " << quoteDataField(normalizePlotLabel(labels[i], 24)) << "\n";
        maxValue = std::max(maxValue, values[i]);
    }

    std::ostringstream script;
    script << styledHeader(id, title);
    script << "unset key\n";
    script << "set ylabel 'Count' font ',11'\n";
    script << "set yrange [0:" << (maxValue > 0.0 ? maxValue * 1.15 : 1.0) << "]\n";
    script << "set xtics rotate by 45 right\n";
    script << "set boxwidth 0.7\nset style fill solid 0.9 border lc rgb '#1f2937'\n";
    script << "plot " << quoteForGnuplot(dataPath(id))
           << " using 1:2:($0+1):xtic(3) with boxes lc variable, '' using 1:2:(sprintf('%d', int($2))) with labels offset 0,0.8 font ',9'\n";
    return runScript(id, data.str(), script.str());
}
