#include "unflake/core/safe_symbols.hpp"
#include "unflake/core/text_utils.hpp"
#include <algorithm>

namespace unflake {

namespace {

const std::vector<std::string> imports_with_side_effects = {"antigravity", "rlcompleter", "this"};

// Often built into the interpreter, so a directory scan misses them
const std::vector<std::string> binary_imports = {"datetime", "grp",    "io",       "json",
                                                 "math",     "multiprocessing",    "parser",
                                                 "pwd",      "string", "operator", "os",
                                                 "sys",      "time"};

auto list_directory(const std::filesystem::path& dir, std::vector<std::string>& names) -> void {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return;
    }
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (auto name = standard_package_name(it->path().filename().string())) {
            names.push_back(*name);
        }
    }
}

} // namespace

SafeSymbolRegistry::SafeSymbolRegistry(const std::vector<std::string>& standard_names,
                                       const std::vector<std::string>& additional_names)
    : names_(standard_names.begin(), standard_names.end()) {
    for (const auto& name : imports_with_side_effects) {
        names_.erase(name);
    }
    names_.insert(binary_imports.begin(), binary_imports.end());

    for (const auto& name : additional_names) {
        auto trimmed = strip(name);
        if (!trimmed.empty()) {
            names_.insert(trimmed);
        }
    }
}

auto SafeSymbolRegistry::with_builtin_standard_library(
    const std::vector<std::string>& additional_names) -> SafeSymbolRegistry {
    return SafeSymbolRegistry(builtin_standard_modules(), additional_names);
}

auto SafeSymbolRegistry::contains(const std::string& name) const -> bool {
    return names_.contains(name);
}

auto SafeSymbolRegistry::size() const -> size_t {
    return names_.size();
}

auto SafeSymbolRegistry::sorted_names() const -> std::vector<std::string> {
    std::vector<std::string> result(names_.begin(), names_.end());
    std::sort(result.begin(), result.end());
    return result;
}

auto builtin_standard_modules() -> const std::vector<std::string>& {
    // Public top-level modules of CPython 3, including ones removed in 3.12
    // and 3.13 that older interpreters still ship.
    static const std::vector<std::string> modules = {
        "abc",         "aifc",         "antigravity", "argparse",   "array",       "ast",
        "asynchat",    "asyncio",      "asyncore",    "atexit",     "audioop",     "base64",
        "bdb",         "binascii",     "bisect",      "builtins",   "bz2",         "cProfile",
        "calendar",    "cgi",          "cgitb",       "chunk",      "cmath",       "cmd",
        "code",        "codecs",       "codeop",      "collections", "colorsys",   "compileall",
        "concurrent",  "configparser", "contextlib",  "contextvars", "copy",       "copyreg",
        "crypt",       "csv",          "ctypes",      "curses",     "dataclasses", "datetime",
        "dbm",         "decimal",      "difflib",     "dis",        "distutils",   "doctest",
        "email",       "encodings",    "ensurepip",   "enum",       "errno",       "faulthandler",
        "fcntl",       "filecmp",      "fileinput",   "fnmatch",    "fractions",   "ftplib",
        "functools",   "gc",           "genericpath", "getopt",     "getpass",     "gettext",
        "glob",        "graphlib",     "grp",         "gzip",       "hashlib",     "heapq",
        "hmac",        "html",         "http",        "idlelib",    "imaplib",     "imghdr",
        "imp",         "importlib",    "inspect",     "io",         "ipaddress",   "itertools",
        "json",        "keyword",      "lib2to3",     "linecache",  "locale",      "logging",
        "lzma",        "mailbox",      "mailcap",     "marshal",    "math",        "mimetypes",
        "mmap",        "modulefinder", "msilib",      "msvcrt",     "multiprocessing", "netrc",
        "nis",         "nntplib",      "ntpath",      "nturl2path", "numbers",     "opcode",
        "operator",    "optparse",     "os",          "ossaudiodev", "pathlib",    "pdb",
        "pickle",      "pickletools",  "pipes",       "pkgutil",    "platform",    "plistlib",
        "poplib",      "posix",        "posixpath",   "pprint",     "profile",     "pstats",
        "pty",         "pwd",          "py_compile",  "pyclbr",     "pydoc",       "pydoc_data",
        "pyexpat",     "queue",        "quopri",      "random",     "re",          "readline",
        "reprlib",     "resource",     "rlcompleter", "runpy",      "sched",       "secrets",
        "select",      "selectors",    "shelve",      "shlex",      "shutil",      "signal",
        "site",        "smtpd",        "smtplib",     "sndhdr",     "socket",      "socketserver",
        "spwd",        "sqlite3",      "sre_compile", "sre_constants", "sre_parse", "ssl",
        "stat",        "statistics",   "string",      "stringprep", "struct",      "subprocess",
        "sunau",       "symtable",     "sys",         "sysconfig",  "syslog",      "tabnanny",
        "tarfile",     "telnetlib",    "tempfile",    "termios",    "textwrap",    "this",
        "threading",   "time",         "timeit",      "tkinter",    "token",       "tokenize",
        "tomllib",     "trace",        "traceback",   "tracemalloc", "tty",        "turtle",
        "turtledemo",  "types",        "typing",      "unicodedata", "unittest",   "urllib",
        "uu",          "uuid",         "venv",        "warnings",   "wave",        "weakref",
        "webbrowser",  "winreg",       "winsound",    "wsgiref",    "xdrlib",      "xml",
        "xmlrpc",      "zipapp",       "zipfile",     "zipimport",  "zlib",        "zoneinfo"};
    return modules;
}

auto standard_package_name(const std::string& entry) -> std::optional<std::string> {
    if (entry.empty() || entry.starts_with('_') || entry.find('-') != std::string::npos) {
        return std::nullopt;
    }

    auto dot = entry.find('.');
    if (dot == std::string::npos) {
        return entry;
    }

    auto suffix = entry.substr(entry.rfind('.') + 1);
    if (suffix != "so" && suffix != "py" && suffix != "pyc") {
        return std::nullopt;
    }
    return entry.substr(0, dot);
}

auto scan_standard_library(const std::filesystem::path& stdlib_dir) -> std::vector<std::string> {
    std::vector<std::string> names;
    list_directory(stdlib_dir, names);
    list_directory(stdlib_dir / "lib-dynload", names);

    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    return names;
}

} // namespace unflake
