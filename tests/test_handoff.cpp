#include "handoff.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>

using quickswitch::Error;
using quickswitch::write_handoff;
using quickswitch::testing::TempDir;
using quickswitch::testing::read_file;
using quickswitch::testing::write_file;

int main() {
    TempDir dir;
    const auto output = dir / "out";
    Error error;

    assert(write_handoff(output, std::filesystem::path("/home/user/projects"), error));
    assert(read_file(output) == "/home/user/projects");

    write_file(output, "stale content from a previous run");
    assert(write_handoff(output, std::nullopt, error));
    assert(read_file(output).empty());

    assert(!write_handoff(dir / "no-such-dir" / "out", std::filesystem::path("/tmp"), error));
    assert(!error.message.empty());

    std::cout << "All handoff tests passed." << std::endl;
    return 0;
}
