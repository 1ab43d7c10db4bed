#include "shell_init.hpp"

#include <cassert>
#include <iostream>
#include <string>

using quickswitch::shell_init_script;

int main() {
    const auto bash = shell_init_script("bash", "/usr/local/bin/quickswitch");
    assert(bash.has_value());
    assert(bash->find("qs()") != std::string::npos);
    assert(bash->find("qshs()") != std::string::npos);
    assert(bash->find("--history") != std::string::npos);
    assert(bash->find("'/usr/local/bin/quickswitch' --output-file") != std::string::npos);
    assert(bash->find("cd \"$dest_path\"") != std::string::npos);

    assert(shell_init_script("ZSH", "qs-bin") == shell_init_script("bash", "qs-bin"));

    const auto fish = shell_init_script("fish", "quickswitch");
    assert(fish.has_value());
    assert(fish->find("function qshs") != std::string::npos);

    const auto pwsh = shell_init_script("powershell", "quickswitch");
    assert(pwsh.has_value());
    assert(pwsh->find("Set-Location") != std::string::npos);

    assert(!shell_init_script("tcsh", "quickswitch").has_value());

    // Quotes in the binary path must not end the quoted word early.
    const std::string quoted_binary = "/opt/it's/quickswitch";
    const auto quoted_bash = shell_init_script("bash", quoted_binary);
    assert(quoted_bash->find(R"('/opt/it'\''s/quickswitch' --output-file)") != std::string::npos);
    const auto quoted_fish = shell_init_script("fish", quoted_binary);
    assert(quoted_fish->find(R"('/opt/it\'s/quickswitch' --output-file)") != std::string::npos);
    const auto quoted_pwsh = shell_init_script("pwsh", quoted_binary);
    assert(quoted_pwsh->find(R"(& '/opt/it''s/quickswitch' --output-file)") != std::string::npos);

    std::cout << "All shell init tests passed." << std::endl;
    return 0;
}
