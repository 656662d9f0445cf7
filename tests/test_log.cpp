#include "test_common.h"

#include "agentbox/json_util.h"
#include "agentbox/log.h"

#include <cstdio>
#include <fstream>
#include <sstream>

using namespace agentbox;

int main() {
    // Test 1: level names
    expect_true(log_level_from_name("DEBUG") == LogLevel::DEBUG, "debug parsed");
    expect_true(log_level_from_name("Error") == LogLevel::ERROR, "error parsed");
    expect_true(log_level_from_name("verbose") == LogLevel::INFO, "unknown falls back to info");
    expect_eq_str(log_level_name(LogLevel::ERROR), "ERROR", "error name");

    // Test 2: level filtering
    {
        std::ostringstream out;
        AgentLogger log(out);
        log.debug("hidden detail");
        log.info("step started");
        log.error("step failed");
        std::string text = out.str();
        expect_true(!contains(text, "hidden detail"), "debug suppressed at INFO");
        expect_true(contains(text, "] INFO step started\n"), "info line");
        expect_true(contains(text, "] ERROR step failed\n"), "error line");
        expect_true(text[0] == '[', "timestamp prefix");

        log.set_level(LogLevel::DEBUG);
        log.debug("now visible");
        expect_true(contains(out.str(), "DEBUG now visible"), "debug after set_level");

        log.set_level(LogLevel::ERROR);
        expect_true(!log.enabled(LogLevel::INFO), "info disabled at ERROR");
    }

    // Test 3: structured events go to the attached EventLog as canonical lines
    {
        char tmpl[] = "/tmp/agentbox_test_log_XXXXXX";
        int fd = mkstemp(tmpl);
        expect_true(fd >= 0, "mkstemp");
        close(fd);
        const std::string path = tmpl;

        std::ostringstream out;
        AgentLogger log(out);
        // Without an EventLog the payload is dropped.
        log.event(0, "ignored", json_object_new_object());

        {
            EventLog events("run-1", path);
            expect_true(events.ok(), "event log opened");
            log.attach(&events);

            json_object* payload = json_object_new_object();
            json_object_object_add(payload, "zeta", json_object_new_int(1));
            json_object_object_add(payload, "alpha", json_util::new_string("x"));
            log.event(3, "sandbox_call", payload);
            log.event(4, "action_step", nullptr);
            log.attach(nullptr);
        }

        std::ifstream in(path);
        std::string l1, l2, extra;
        std::getline(in, l1);
        std::getline(in, l2);
        expect_true(!std::getline(in, extra), "exactly two lines");
        expect_true(l1.rfind("{\"event\":\"sandbox_call\",\"payload\":{\"alpha\":\"x\",\"zeta\":1},"
                             "\"run_id\":\"run-1\",\"step\":3,\"ts\":\"", 0) == 0,
                    "canonical event line: " + l1);
        expect_true(contains(l2, "\"payload\":null"), "null payload");
        std::remove(path.c_str());
    }

    // Test 4: null logger swallows everything
    null_logger().error("nothing");
    null_logger().event(1, "x", json_object_new_object());

    std::cerr << "test_log: ALL PASSED" << std::endl;
    return 0;
}
