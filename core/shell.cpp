#include "shell.hpp"

#include "logging.hpp"

#include <sys/wait.h>

#include <cstdlib>

namespace quiesce::shell
{

std::string escape(const std::string& word)
{
    std::string out;
    out.reserve(word.size() + 2);
    out.push_back('\'');
    for (char c : word)
    {
        if (c == '\'')
            out += "'\\''";
        else
            out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string joinCommand(const std::string& tool, const std::string& verb,
                        const std::vector<std::string>& args)
{
    std::string cmd = tool + " " + verb;
    for (const auto& a : args)
        cmd += " " + escape(a);
    return cmd;
}

// Session daemons need their user's runtime dir and bus, not ours.
static std::string dropPrivileges(const ProcessOwner& o)
{
    const std::string uid = std::to_string(o.uid);
    const std::string runtime = "/run/user/" + uid;
    return "setpriv --reuid=" + uid + " --regid=" + std::to_string(o.gid) +
           " --init-groups --reset-env env XDG_RUNTIME_DIR=" + runtime +
           " DBUS_SESSION_BUS_ADDRESS=unix:path=" + runtime + "/bus ";
}

std::string launchCommand(const std::vector<LaunchTarget>& targets)
{
    if (targets.empty())
        return {};

    std::string cmd = "rc=0;";
    for (const auto& t : targets)
    {
        const std::string exe = escape(t.executable);
        cmd += " [ -x " + exe + " ] && ";
        if (t.owner && t.owner->uid != 0)
            cmd += dropPrivileges(*t.owner);
        cmd += "setsid -f " + exe + " >/dev/null 2>&1 || rc=1;";
    }
    cmd += " exit $rc";
    return cmd;
}

bool run(const std::string& cmd)
{
    int rc = std::system(cmd.c_str());
    if (rc == -1)
    {
        log::warn("cannot spawn shell for: " + cmd);
        return false;
    }
    if (!WIFEXITED(rc) || WEXITSTATUS(rc) != 0)
    {
        log::warn("command failed (status " +
                  std::to_string(WIFEXITED(rc) ? WEXITSTATUS(rc) : rc) +
                  "): " + cmd);
        return false;
    }
    return true;
}

} // namespace quiesce::shell
