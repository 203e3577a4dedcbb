#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <cleanmarkers/scanner.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <cstdlib>
#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>

namespace fs = std::filesystem;

static fs::path make_tmpdir(const std::string& prefix) {
    fs::path base = fs::temp_directory_path() / (prefix + "XXXXXX");
    std::string s = base.string();
    std::vector<char> buf(s.begin(), s.end());
    buf.push_back('\0');
    char* p = mkdtemp(buf.data());
    REQUIRE(p != nullptr);
    return fs::path(p);
}

static fs::path find_cleanmarkers_binary() {
    const char* env = std::getenv("CLEANMARKERS_BIN");
    if (env && fs::exists(env)) return fs::path(env);
    fs::path a = fs::current_path() / "../bin/cleanmarkers";
    if (fs::exists(a)) return a;
    fs::path b = fs::current_path() / "bin/cleanmarkers";
    if (fs::exists(b)) return b;
    return {};
}

static int run_bin(const fs::path& bin, const std::vector<std::string>& args) {
    std::vector<std::string> all{"cleanmarkers"};
    all.insert(all.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& a : all) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    REQUIRE(pid >= 0);
    if (pid == 0) {
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
        }
        execv(bin.c_str(), argv.data());
        _exit(127);
    }
    int status = 0;
    waitpid(pid, &status, 0);
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

static std::string slurp(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static const std::string kMarked = "intro\n" + std::string(cleanmarkers::kStartMarker) +
                                   "\ndraft\n" + std::string(cleanmarkers::kEndMarker) + "\noutro\n";

TEST_CASE("CLI: rewrites files and exits 0") {
    auto bin = find_cleanmarkers_binary();
    REQUIRE(fs::exists(bin));

    auto dir = make_tmpdir("cm_cli_");
    std::ofstream(dir / "a.md") << kMarked;
    std::ofstream(dir / "b.txt") << kMarked;

    REQUIRE(run_bin(bin, {dir.string()}) == 0);
    REQUIRE(slurp(dir / "a.md") == "intro\noutro\n");
    REQUIRE(slurp(dir / "b.txt") == kMarked);

    fs::remove_all(dir);
}

TEST_CASE("CLI: dry run and extension list") {
    auto bin = find_cleanmarkers_binary();
    REQUIRE(fs::exists(bin));

    auto dir = make_tmpdir("cm_cli_dry_");
    std::ofstream(dir / "a.md") << kMarked;
    std::ofstream(dir / "b.txt") << kMarked;

    REQUIRE(run_bin(bin, {"--dry-run", "--ext=md,txt", "-v", dir.string()}) == 0);
    REQUIRE(slurp(dir / "a.md") == kMarked);
    REQUIRE(slurp(dir / "b.txt") == kMarked);

    REQUIRE(run_bin(bin, {"--ext=txt", dir.string()}) == 0);
    REQUIRE(slurp(dir / "a.md") == kMarked);
    REQUIRE(slurp(dir / "b.txt") == "intro\noutro\n");

    fs::remove_all(dir);
}

TEST_CASE("CLI: fatal errors happen before any file is touched") {
    auto bin = find_cleanmarkers_binary();
    REQUIRE(fs::exists(bin));

    auto dir = make_tmpdir("cm_cli_err_");
    std::ofstream(dir / "a.md") << kMarked;

    REQUIRE(run_bin(bin, {"--age=yesterday", dir.string()}) == 2);
    REQUIRE(run_bin(bin, {}) == 2);
    REQUIRE(run_bin(bin, {dir.string(), (dir / "missing").string()}) == 1);
    REQUIRE(run_bin(bin, {(dir / "a.md").string()}) == 1);
    REQUIRE(slurp(dir / "a.md") == kMarked);

    REQUIRE(run_bin(bin, {"--version"}) == 0);
    REQUIRE(run_bin(bin, {"--help"}) == 0);

    fs::remove_all(dir);
}
