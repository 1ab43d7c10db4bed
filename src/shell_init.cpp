#include "shell_init.hpp"

#include "text_format.hpp"

namespace quickswitch {
namespace {

// POSIX single quotes take everything literally; an embedded quote becomes '\''.
std::string posix_quote(const std::string &text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

// Fish single quotes understand \' and \\.
std::string fish_quote(const std::string &text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    return quoted + "'";
}

std::string powershell_quote(const std::string &text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

std::string posix_script(const std::string &binary) {
    std::string script;
    script += "__quickswitch_run() {\n";
    script += "  local tmp_file dest_path\n";
    script += "  tmp_file=\"$(mktemp)\" || return 1\n";
    script += "  " + posix_quote(binary) + " --output-file \"$tmp_file\" \"$@\"\n";
    script += "  dest_path=\"$(cat \"$tmp_file\")\"\n";
    script += "  rm -f \"$tmp_file\"\n";
    script += "  if [ -n \"$dest_path\" ] && [ -d \"$dest_path\" ]; then\n";
    script += "    cd \"$dest_path\" || return 1\n";
    script += "  elif [ -n \"$dest_path\" ]; then\n";
    script += "    echo \"quickswitch: not a directory: $dest_path\" >&2\n";
    script += "    return 1\n";
    script += "  fi\n";
    script += "}\n";
    script += "qs() { __quickswitch_run \"$@\"; }\n";
    script += "qshs() { __quickswitch_run --history \"$@\"; }\n";
    return script;
}

std::string fish_script(const std::string &binary) {
    std::string script;
    script += "function __quickswitch_run\n";
    script += "    set -l tmp_file (mktemp)\n";
    script += "    or return 1\n";
    script += "    " + fish_quote(binary) + " --output-file $tmp_file $argv\n";
    script += "    set -l dest_path (cat $tmp_file)\n";
    script += "    rm -f $tmp_file\n";
    script += "    if test -n \"$dest_path\"; and test -d \"$dest_path\"\n";
    script += "        cd $dest_path\n";
    script += "    else if test -n \"$dest_path\"\n";
    script += "        echo \"quickswitch: not a directory: $dest_path\" >&2\n";
    script += "        return 1\n";
    script += "    end\n";
    script += "end\n";
    script += "function qs\n    __quickswitch_run $argv\nend\n";
    script += "function qshs\n    __quickswitch_run --history $argv\nend\n";
    return script;
}

std::string powershell_script(const std::string &binary) {
    std::string script;
    script += "function __quickswitch_run {\n";
    script += "    $tmpFile = New-TemporaryFile\n";
    script += "    & " + powershell_quote(binary) + " --output-file $tmpFile.FullName @args\n";
    script += "    $destPath = Get-Content -Raw -LiteralPath $tmpFile.FullName\n";
    script += "    Remove-Item -Force -LiteralPath $tmpFile.FullName\n";
    script += "    if ($destPath -and (Test-Path -LiteralPath $destPath -PathType Container)) {\n";
    script += "        Set-Location -LiteralPath $destPath\n";
    script += "    } elseif ($destPath) {\n";
    script += "        Write-Error \"quickswitch: not a directory: $destPath\"\n";
    script += "    }\n";
    script += "}\n";
    script += "function qs { __quickswitch_run @args }\n";
    script += "function qshs { __quickswitch_run --history @args }\n";
    return script;
}

}

std::optional<std::string> shell_init_script(const std::string &shell, const std::string &binary) {
    const std::string name = to_lower_ascii(shell);
    if (name == "bash" || name == "zsh") {
        return posix_script(binary);
    }
    if (name == "fish") {
        return fish_script(binary);
    }
    if (name == "powershell" || name == "pwsh") {
        return powershell_script(binary);
    }
    return std::nullopt;
}

}
