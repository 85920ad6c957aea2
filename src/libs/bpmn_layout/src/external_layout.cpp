#include <bpmn_layout/external_layout.hpp>
#include <bpmn_layout/layout_constants.hpp>
#include <bpmn_layout/logging.hpp>
#include <bpmn_model/shape_types.hpp>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <locale>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

extern char** environ;

namespace bpmn_layout {

namespace {

// Closes the descriptor on scope exit.
class FileDescriptor {
public:
    explicit FileDescriptor(int fd = -1) : fd_(fd) {}
    ~FileDescriptor() { reset(); }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    void reset() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_;
};

// Temporary DOT file, removed on scope exit.
class TempFile {
public:
    TempFile() {
        std::string pattern = (std::filesystem::temp_directory_path() / "bpmn_layout_XXXXXX.dot").string();
        const int fd = ::mkstemps(pattern.data(), 4);
        if (fd < 0) throw std::system_error(errno, std::generic_category(), "mkstemps");
        ::close(fd);
        path_ = std::move(pattern);
    }
    ~TempFile() { ::unlink(path_.c_str()); }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

std::string quoted(const std::string& id) {
    std::string out = "\"";
    for (char c : id) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

Size size_of(const SizeMap& sizes, const std::string& id) {
    const auto it = sizes.find(id);
    if (it != sizes.end()) return it->second;
    const auto [w, h] = bpmn_model::default_dimensions("");
    return { w, h };
}

// Whitespace separated tokens; double-quoted tokens may contain spaces and \" escapes.
std::vector<std::string> split_plain_line(const std::string& line) {
    std::vector<std::string> tokens;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t' || line[i] == '\r')) ++i;
        if (i >= line.size()) break;
        std::string token;
        if (line[i] == '"') {
            ++i;
            while (i < line.size() && line[i] != '"') {
                if (line[i] == '\\' && i + 1 < line.size()) ++i;
                token += line[i++];
            }
            if (i >= line.size()) throw ExternalLayoutError("unterminated string in layout output");
            ++i;
        } else {
            while (i < line.size() && line[i] != ' ' && line[i] != '\t' && line[i] != '\r')
                token += line[i++];
        }
        tokens.push_back(std::move(token));
    }
    return tokens;
}

double parse_number(const std::string& token) {
    std::istringstream in(token);
    in.imbue(std::locale::classic());
    double v = 0;
    in >> v;
    if (in.fail() || !in.eof()) throw ExternalLayoutError("invalid number '" + token + "' in layout output");
    return v;
}

// Runs `executable -Tplain dot_file` and returns its standard output.
std::string run_dot(const std::string& executable, const std::string& dot_file) {
    int pipe_fds[2];
    if (::pipe(pipe_fds) != 0) throw std::system_error(errno, std::generic_category(), "pipe");
    FileDescriptor read_end(pipe_fds[0]);
    FileDescriptor write_end(pipe_fds[1]);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, write_end.get(), STDOUT_FILENO);
    posix_spawn_file_actions_addclose(&actions, read_end.get());
    posix_spawn_file_actions_addclose(&actions, write_end.get());
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    std::string arg0 = executable;
    std::string arg1 = "-Tplain";
    std::string arg2 = dot_file;
    char* argv[] = { arg0.data(), arg1.data(), arg2.data(), nullptr };

    pid_t pid = 0;
    const int rc = ::posix_spawnp(&pid, executable.c_str(), &actions, nullptr, argv, environ);
    posix_spawn_file_actions_destroy(&actions);
    write_end.reset();
    if (rc != 0)
        throw ExternalLayoutError("could not start '" + executable + "': " + std::strerror(rc));

    std::string output;
    char buffer[4096];
    for (;;) {
        const ssize_t n = ::read(read_end.get(), buffer, sizeof(buffer));
        if (n > 0) {
            output.append(buffer, static_cast<std::size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            const int err = errno;
            ::waitpid(pid, nullptr, 0);
            throw std::system_error(err, std::generic_category(), "read from " + executable);
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw std::system_error(errno, std::generic_category(), "waitpid");
    }
    if (!WIFEXITED(status))
        throw ExternalLayoutError("'" + executable + "' terminated abnormally");
    if (WEXITSTATUS(status) != 0)
        throw ExternalLayoutError("'" + executable + "' exited with status " + std::to_string(WEXITSTATUS(status)));
    return output;
}

} // namespace

GraphvizLayoutEngine::GraphvizLayoutEngine(std::string executable)
    : executable_(std::move(executable))
{
}

RawLayout GraphvizLayoutEngine::compute(const FlowGraph& graph, const SizeMap& sizes, Direction direction) const {
    TempFile dot_file;
    {
        std::ofstream out(dot_file.path(), std::ios::binary | std::ios::trunc);
        if (!out) throw ExternalLayoutError("could not write " + dot_file.path());
        out << write_dot(graph, sizes, direction);
        if (!out) throw ExternalLayoutError("could not write " + dot_file.path());
    }

    layout_logger()->debug("Running {} on {} nodes, {} edges", executable_, graph.nodes.size(), graph.edge_count);
    RawLayout raw = parse_plain_output(run_dot(executable_, dot_file.path()));
    layout_logger()->debug("{} placed {} of {} nodes", executable_, raw.positions.size(), graph.nodes.size());
    return raw;
}

std::string write_dot(const FlowGraph& graph, const SizeMap& sizes, Direction direction) {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << "strict digraph G {\n"
        << "  rankdir=" << to_string(direction) << ";\n"
        << "  nodesep=" << layout::graphviz_nodesep << ";\n"
        << "  ranksep=" << layout::graphviz_ranksep << ";\n"
        << "  splines=ortho;\n"
        << "  node [shape=box, fixedsize=true];\n";
    for (const auto& id : graph.nodes) {
        const Size s = size_of(sizes, id);
        out << "  " << quoted(id)
            << " [width=" << s.width / layout::graphviz_points_per_inch
            << ", height=" << s.height / layout::graphviz_points_per_inch << "];\n";
    }
    for (const auto& from : graph.nodes) {
        for (const auto& to : graph.successors_of(from))
            out << "  " << quoted(from) << " -> " << quoted(to) << ";\n";
    }
    out << "}\n";
    return out.str();
}

RawLayout parse_plain_output(const std::string& text) {
    RawLayout raw;
    bool has_graph = false;

    // Long lines may be continued with a trailing backslash.
    std::string joined;
    joined.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 1 < text.size() && text[i + 1] == '\n') {
            ++i;
            continue;
        }
        joined += text[i];
    }

    std::istringstream lines(joined);
    std::string line;
    while (std::getline(lines, line)) {
        const auto tokens = split_plain_line(line);
        if (tokens.empty()) continue;
        const std::string& kind = tokens[0];
        if (kind == "graph") {
            if (tokens.size() < 4) throw ExternalLayoutError("malformed graph line in layout output");
            raw.width = parse_number(tokens[2]);
            raw.height = parse_number(tokens[3]);
            has_graph = true;
        } else if (kind == "node") {
            if (tokens.size() < 6) throw ExternalLayoutError("malformed node line in layout output");
            const double cx = parse_number(tokens[2]);
            const double cy = parse_number(tokens[3]);
            const double w = parse_number(tokens[4]);
            const double h = parse_number(tokens[5]);
            raw.positions[tokens[1]] = { cx - w / 2, cy + h / 2 };
        } else if (kind == "edge") {
            continue;
        } else if (kind == "stop") {
            break;
        } else {
            throw ExternalLayoutError("unexpected line in layout output: " + line);
        }
    }

    if (!has_graph) throw ExternalLayoutError("layout output has no graph line");
    return raw;
}

void complete_raw_layout(RawLayout& raw, const FlowGraph& graph, const SizeMap& sizes) {
    double right = raw.width;
    double top = raw.height;
    for (const auto& [id, p] : raw.positions) {
        const Size s = size_of(sizes, id);
        right = std::max(right, p.x + s.width / layout::graphviz_points_per_inch);
        top = std::max(top, p.y);
    }

    const double column_x = right + layout::graphviz_nodesep;
    double next_y = top;
    for (const auto& id : graph.nodes) {
        if (raw.positions.count(id)) continue;
        const Size s = size_of(sizes, id);
        raw.positions[id] = { column_x, next_y };
        next_y -= s.height / layout::graphviz_points_per_inch + layout::graphviz_nodesep;
        layout_logger()->debug("Node '{}' missing from external layout, placed at ({}, {})", id, column_x, raw.positions[id].y);
    }
}

} // namespace bpmn_layout
