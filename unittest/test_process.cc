//
// Created by igor on 19/10/2026.
//
// Unit tests for child processes, job directories and the worker pool
//

#include <doctest/doctest.h>
#include <inkfont/utils/parallel.hh>
#include <inkfont/utils/process.hh>
#include <inkfont/utils/work_directory.hh>
#include <csignal>
#include <functional>
#include <system_error>
#include <thread>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace inkfont;

TEST_SUITE("process") {

    TEST_CASE("exit status") {
        work_directory dir;
        CHECK(run_process({"true"}, dir.file("true", ".log")).ok());

        const process_result r = run_process({"false"}, dir.file("false", ".log"));
        CHECK_FALSE(r.ok());
        CHECK(r.exit_code == 1);
        CHECK(r.signal == 0);
    }

    TEST_CASE("output tail of a failed command") {
        work_directory dir;
        const process_result r = run_process({"sh", "-c", "echo to-stdout; echo to-stderr >&2; exit 3"},
                                             dir.file("sh", ".log"));
        CHECK(r.exit_code == 3);
        CHECK(r.output_tail.find("to-stdout") != std::string::npos);
        CHECK(r.output_tail.find("to-stderr") != std::string::npos);
    }

    TEST_CASE("killed by a signal") {
        work_directory dir;
        const process_result r = run_process({"sh", "-c", "kill -TERM $$"}, dir.file("kill", ".log"));
        CHECK_FALSE(r.ok());
        CHECK(r.signal == SIGTERM);
        CHECK(r.exit_code == -1);
    }

    TEST_CASE("program that cannot start") {
        work_directory dir;
        CHECK_THROWS((void)run_process({}, dir.file("x", ".log")));
        bool failed = false;
        try {
            failed = !run_process({"inkfont-no-such-program"}, dir.file("missing", ".log")).ok();
        } catch (const std::runtime_error&) {
            failed = true;
        }
        CHECK(failed);
    }

    TEST_CASE("read tail") {
        work_directory dir;
        const auto path = dir.file("log", ".txt");
        {
            std::ofstream out(path);
            out << "0123456789";
        }
        CHECK(read_tail(path, 4) == "6789");
        CHECK(read_tail(path) == "0123456789");
        CHECK(read_tail(dir.file("absent", ".txt")).empty());
    }
}

TEST_SUITE("work_directory") {

    TEST_CASE("removed on destruction") {
        std::filesystem::path path;
        {
            work_directory dir;
            path = dir.path();
            CHECK(std::filesystem::is_directory(path));
            CHECK(path.filename().string().rfind("inkfont-", 0) == 0);
            std::ofstream(dir.file("cell_000_U+0041", ".pbm")) << "P4\n1 1\n";
            CHECK(dir.file("cell_000_U+0041", ".pbm").filename() == "cell_000_U+0041.pbm");
        }
        CHECK_FALSE(std::filesystem::exists(path));
    }

    TEST_CASE("kept on request") {
        work_directory root;
        std::filesystem::path path;
        {
            work_directory dir(root.path());
            dir.keep();
            CHECK(dir.kept());
            path = dir.path();
        }
        CHECK(std::filesystem::is_directory(path));
        CHECK(path.parent_path() == root.path());
    }

    TEST_CASE("unique per job") {
        work_directory a;
        work_directory b;
        CHECK(a.path() != b.path());
    }
}

TEST_SUITE("parallel") {

    TEST_CASE("refused threads leave the calling thread to finish") {
        for (int limit : {0, 1, 3}) {
            int started = 0;
            auto spawn = [&started, limit](auto& work) {
                if (started == limit) {
                    throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                            "thread limit");
                }
                ++started;
                return std::thread(std::ref(work));
            };

            const cancellation_token cancel;
            const auto out = parallel_map(200, 4, cancel, [](std::size_t i) { return i + 1; }, spawn);
            CHECK(started == limit);
            REQUIRE(out.size() == 200);
            for (std::size_t i = 0; i < out.size(); ++i) {
                REQUIRE(out[i].has_value());
                CHECK(*out[i] == i + 1);
            }
        }
    }

    TEST_CASE("results keep their index") {
        const cancellation_token cancel;
        const auto out = parallel_map(100, 4, cancel, [](std::size_t i) { return static_cast<int>(i * i); });
        REQUIRE(out.size() == 100);
        for (std::size_t i = 0; i < out.size(); ++i) {
            REQUIRE(out[i].has_value());
            CHECK(*out[i] == static_cast<int>(i * i));
        }
    }

    TEST_CASE("first error is rethrown after the join") {
        const cancellation_token cancel;
        CHECK_THROWS_AS(parallel_map(50, 3, cancel, [](std::size_t i) {
            if (i == 7) {
                throw std::logic_error("cell 7");
            }
            return i;
        }), std::logic_error);
    }

    TEST_CASE("cancelled before start") {
        cancellation_token cancel;
        cancel.cancel();
        const auto out = parallel_map(10, 2, cancel, [](std::size_t i) { return i; });
        for (const auto& slot : out) {
            CHECK_FALSE(slot.has_value());
        }
    }

    TEST_CASE("cancelled midway") {
        cancellation_token cancel;
        const auto out = parallel_map(1000, 1, cancel, [&cancel](std::size_t i) {
            if (i == 10) {
                cancel.cancel();
            }
            return i;
        });
        CHECK(out[10].has_value());
        CHECK_FALSE(out[11].has_value());
    }

    TEST_CASE("worker count") {
        CHECK(effective_workers(4, 100) == 4);
        CHECK(effective_workers(8, 3) == 3);
        CHECK(effective_workers(0, 0) == 1);
        CHECK(effective_workers(0, 1000) >= 1);
    }
}
