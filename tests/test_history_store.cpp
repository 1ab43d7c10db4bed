#include "history_store.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

using namespace quickswitch;
using quickswitch::testing::TempDir;
using quickswitch::testing::read_file;
using quickswitch::testing::write_file;

namespace {

void test_record_moves_to_front() {
    TempDir dir;
    HistoryStore store(dir / "history.txt");
    Error error;
    assert(store.load(error));
    assert(store.list().empty());

    assert(store.record("/srv/a", error));
    assert(store.record("/srv/b", error));
    assert(store.record("/srv/a", error));

    const auto &list = store.list();
    assert(list.size() == 2);
    assert(list[0].path == "/srv/a");
    assert(list[0].visits == 2);
    assert(list[0].last_visited > 0);
    assert(list[1].path == "/srv/b");
    assert(list[1].visits == 1);
}

void test_cap_is_enforced() {
    TempDir dir;
    HistoryStore store(dir / "history.txt", 3);
    Error error;
    for (int i = 0; i < 20; ++i) {
        assert(store.record("/srv/dir" + std::to_string(i), error));
        assert(store.list().size() <= 3);
    }
    assert(store.list().size() == 3);
    assert(store.list().front().path == "/srv/dir19");

    HistoryStore reloaded(dir / "history.txt", 3);
    assert(reloaded.load(error));
    assert(reloaded.list().size() == 3);
    assert(reloaded.list().back().path == "/srv/dir17");
}

void test_round_trip_and_format() {
    TempDir dir;
    const auto file = dir / "nested" / "history.txt";
    Error error;
    {
        HistoryStore store(file);
        assert(store.record("/home/user/projects", error));
        assert(store.record("/tmp", error));
    }
    const std::string content = read_file(file);
    assert(content.find("\t1\t/tmp\n") != std::string::npos);
    assert(content.find("\t1\t/home/user/projects\n") != std::string::npos);

    HistoryStore store(file);
    assert(store.load(error));
    assert(store.list().size() == 2);
    assert(store.list()[0].path == "/tmp");
    assert(store.list()[1].path == "/home/user/projects");
}

void test_paths_with_separators_round_trip() {
    TempDir dir;
    const auto file = dir / "history.txt";
    const std::filesystem::path newline_dir = dir.path() / "a\nb";
    const std::filesystem::path tab_dir = dir.path() / "tab\there";
    const std::filesystem::path backslash_dir = dir.path() / "back\\n";
    Error error;
    {
        HistoryStore store(file);
        assert(store.record(newline_dir, error));
        assert(store.record(tab_dir, error));
        assert(store.record(backslash_dir, error));
    }
    const std::string raw = read_file(file);
    assert(std::count(raw.begin(), raw.end(), '\n') == 3);

    HistoryStore reloaded(file);
    assert(reloaded.load(error));
    const auto &list = reloaded.list();
    assert(list.size() == 3);
    assert(list[0].path == backslash_dir);
    assert(list[1].path == tab_dir);
    assert(list[2].path == newline_dir);

    write_file(file, "1700000000\t1\t/bad\\qescape\n");
    assert(reloaded.load(error));
    assert(reloaded.list().empty());
}

void test_legacy_and_malformed_lines() {
    TempDir dir;
    const auto file = dir / "history.txt";
    write_file(file,
               "/legacy/path\n"
               "relative/path\n"
               "1700000000\t4\t/with/tabs\n"
               "notanumber\t1\t/bad/time\n"
               "1700000000\t0\t/zero/visits\n"
               "\n"
               "/legacy/path\n");

    HistoryStore store(file);
    Error error;
    assert(store.load(error));
    const auto &list = store.list();
    assert(list.size() == 2);
    assert(list[0].path == "/legacy/path");
    assert(list[0].visits == 1);
    assert(list[1].path == "/with/tabs");
    assert(list[1].visits == 4);
    assert(list[1].last_visited == 1700000000);
}

void test_corrupt_file() {
    TempDir dir;
    const auto file = dir / "history.txt";
    write_file(file, std::string("/ok\n/bro\0ken\n", 13));

    HistoryStore store(file);
    Error error;
    assert(!store.load(error));
    assert(error.kind == ErrorKind::PersistenceFailure);
    assert(store.list().empty());

    // The store stays usable after a failed load.
    assert(store.record("/fresh", error));
    assert(store.list().size() == 1);
}

void test_unwritable_location() {
    TempDir dir;
    write_file(dir / "blocker", "");
    HistoryStore store(dir / "blocker" / "history.txt");
    Error error;
    assert(!store.record("/srv/a", error));
    assert(error.kind == ErrorKind::PersistenceFailure);
    assert(store.list().size() == 1);
}

void test_display_order() {
    HistoryStore store("");
    Error error;
    assert(store.record("/b/zeta", error));
    assert(store.record("/a/alpha", error));
    assert(store.record("/b/zeta", error));
    assert(store.record("/c/Mid", error));

    auto recent = store.display_order(HistorySort::Recent);
    assert(recent[0].path == "/c/Mid");

    auto frequency = store.display_order(HistorySort::Frequency);
    assert(frequency[0].path == "/b/zeta");

    auto alphabetical = store.display_order(HistorySort::Alphabetical);
    assert(alphabetical[0].path == "/a/alpha");
    assert(alphabetical[1].path == "/c/Mid");
    assert(alphabetical[2].path == "/b/zeta");

    assert(parse_history_sort("Frequency", HistorySort::Recent) == HistorySort::Frequency);
    assert(parse_history_sort("bogus", HistorySort::Alphabetical) == HistorySort::Alphabetical);
    assert(std::string(history_sort_name(HistorySort::Recent)) == "recent");
}

}

int main() {
    test_record_moves_to_front();
    test_cap_is_enforced();
    test_round_trip_and_format();
    test_paths_with_separators_round_trip();
    test_legacy_and_malformed_lines();
    test_corrupt_file();
    test_unwritable_location();
    test_display_order();

    std::cout << "All history store tests passed." << std::endl;
    return 0;
}
