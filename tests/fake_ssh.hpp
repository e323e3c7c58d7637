#pragma once

// Stand-in remote shell for tests: a script that answers -V like OpenSSH
// and otherwise runs the command locally with TARGET set to the host.

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

inline fs::path make_test_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() /
                   ("sshbatch_" + name + "_" + std::to_string(getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline fs::path write_script(const fs::path& path, const std::string& body) {
    {
        std::ofstream out(path);
        out << "#!/bin/sh\n" << body;
    }
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                    fs::perm_options::replace);
    return path;
}

inline const char* FAKE_OPENSSH_BODY =
    "if [ \"$1\" = \"-V\" ]; then\n"
    "  echo 'OpenSSH_9.6p1 Ubuntu-3ubuntu13, OpenSSL 3.0.13 30 Jan 2024' >&2\n"
    "  exit 0\n"
    "fi\n"
    "if [ \"$1\" != \"-nqo\" ] || [ \"$2\" != \"BatchMode=yes\" ] || [ $# -ne 4 ]; then\n"
    "  echo \"bad ssh args: $*\" >&2\n"
    "  exit 255\n"
    "fi\n"
    "TARGET=\"$3\"\n"
    "export TARGET\n"
    "exec /bin/sh -c \"$4\"\n";

inline fs::path write_fake_ssh(const fs::path& dir) {
    return write_script(dir / "ssh", FAKE_OPENSSH_BODY);
}
