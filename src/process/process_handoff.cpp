#include "process/process_handoff.hpp"
#include "utils/error.hpp"
#include "utils/log.hpp"
#include "utils/utils.hpp"
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun {
namespace process {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
static bool isExecutableFile(const string& path)
// Regular file with execute permission
{
    struct stat info;
    if (::stat(path.c_str(), &info) != 0)
        return false;
    return S_ISREG(info.st_mode) && ::access(path.c_str(), X_OK) == 0;
}
//---------------------------------------------------------------------------
memory::ExternalFileReference ProcessHandoff::finalize(memory::MemoryBuffer&& buffer)
// Transfers the descriptor
{
    auto size = buffer.size();
    auto reference = move(buffer).consume();
    utils::Log::debug("Memory file ready at ", reference.getPath(), " (", size, " bytes)");
    return reference;
}
//---------------------------------------------------------------------------
vector<string> ProcessHandoff::substitutePlaceholder(const vector<string>& args, string_view token, const memory::ExternalFileReference& reference)
// Textual replacement in every argument
{
    vector<string> result;
    result.reserve(args.size());
    for (auto& arg : args)
        result.push_back(utils::replaceAll(arg, token, reference.getPath()));
    return result;
}
//---------------------------------------------------------------------------
vector<string> ProcessHandoff::buildEnvironment(const memory::ExternalFileReference& reference, const char* const* base)
// Copies the base and sets the reference variable
{
    vector<string> environment;
    string prefix = string(referenceVariable) + "=";
    if (base) {
        for (auto entry = base; *entry; ++entry) {
            string_view view(*entry);
            if (view.starts_with(prefix))
                continue;
            environment.emplace_back(view);
        }
    }
    environment.push_back(prefix + reference.getPath());
    return environment;
}
//---------------------------------------------------------------------------
string ProcessHandoff::resolveProgram(const string& program, const char* searchPath)
// Same lookup rules as execvp
{
    if (program.empty())
        throw utils::ExecError(program, "empty program name");
    if (program.find('/') != string::npos) {
        if (!isExecutableFile(program))
            throw utils::ExecError(program, "not an executable file");
        return program;
    }
    string_view path = searchPath ? searchPath : "/usr/local/bin:/usr/bin:/bin";
    while (true) {
        auto separator = path.find(':');
        auto directory = path.substr(0, separator);
        auto candidate = (directory.empty() ? string(".") : string(directory)) + "/" + program;
        if (isExecutableFile(candidate))
            return candidate;
        if (separator == string_view::npos)
            break;
        path.remove_prefix(separator + 1);
    }
    throw utils::ExecError(program, "not found in PATH");
}
//---------------------------------------------------------------------------
void ProcessHandoff::execReplace(const string& path, const string& name, const vector<string>& args, const vector<string>& environment)
// execve, argv[0] is the name as given
{
    vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(name.c_str()));
    for (auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    vector<char*> envp;
    envp.reserve(environment.size() + 1);
    for (auto& entry : environment)
        envp.push_back(const_cast<char*>(entry.c_str()));
    envp.push_back(nullptr);

    ::execve(path.c_str(), argv.data(), envp.data());
    throw utils::ExecError(path, strerror(errno));
}
//---------------------------------------------------------------------------
}; // namespace process
}; // namespace memrun
