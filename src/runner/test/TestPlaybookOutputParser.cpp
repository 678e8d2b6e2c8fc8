#include "PlaybookOutputParser.hpp"
#include <cassert>
#include <iostream>
#include <thread>

static const char* const kRun[] = {
    "PLAY [wazuh managers] **********************************************************",
    "",
    "TASK [Gathering Facts] *********************************************************",
    "ok: [manager1]",
    "fatal: [agent7]: UNREACHABLE! => {\"changed\": false, \"unreachable\": true}",
    "",
    "TASK [wazuh-manager : Install package] ****************************************",
    "changed: [manager1]",
    "skipping: [agent2]",
    "ok: [agent3 -> localhost]",
    "",
    "RUNNING HANDLER [wazuh-manager : restart wazuh-manager] ************************",
    "changed: [manager1]",
    "fatal: [agent2]: FAILED! => {\"msg\": \"Service not found\"}",
    "",
    "PLAY RECAP *********************************************************************",
    "manager1                   : ok=3    changed=2    unreachable=0    failed=0",
};

void test_task_results() {
    PlaybookOutputParser parser;
    assert(parser.current_task() == "Starting");
    for (const char* line : kRun) {
        parser.consume(line);
    }

    auto results = parser.results();
    assert(results.size() == 7);
    assert(results[0].host == "manager1" && results[0].task == "Gathering Facts" && results[0].status == "ok");
    assert(results[1].host == "agent7" && results[1].status == "unreachable");
    assert(results[2].task == "wazuh-manager : Install package" && results[2].status == "changed");
    assert(results[3].host == "agent2" && results[3].status == "skipping");
    assert(results[4].host == "agent3" && results[4].status == "ok");
    assert(results[5].task == "wazuh-manager : restart wazuh-manager");
    assert(results[6].host == "agent2" && results[6].status == "fatal");
    assert(parser.current_task() == "wazuh-manager : restart wazuh-manager");

    auto summary = parser.summary();
    assert(summary["ok"] == 2);
    assert(summary["changed"] == 2);
    assert(summary["skipping"] == 1);
    assert(summary["fatal"] == 1);
    assert(summary["unreachable"] == 1);
    assert(summary.count("failed") == 0);
    std::cout << "test_task_results passed" << std::endl;
}

void test_ignores_noise() {
    PlaybookOutputParser parser;
    parser.consume("ok: manager1 without brackets");
    parser.consume("TASK [unterminated");
    parser.consume("  ok: [indented]  \r");
    parser.consume("changed: [broken");

    auto results = parser.results();
    assert(results.size() == 1);
    assert(results[0].host == "indented");
    assert(results[0].task == "Starting");
    std::cout << "test_ignores_noise passed" << std::endl;
}

void test_concurrent_reader() {
    PlaybookOutputParser parser;
    std::thread writer([&] {
        for (int i = 0; i < 500; ++i) {
            parser.consume("TASK [step " + std::to_string(i) + "] ***");
            parser.consume("ok: [host" + std::to_string(i % 5) + "]");
        }
    });
    size_t last = 0;
    while (last < 500) {
        size_t now = parser.results().size();
        assert(now >= last);
        last = now;
        parser.current_task();
    }
    writer.join();
    assert(parser.summary()["ok"] == 500);
    assert(parser.current_task() == "step 499");
    std::cout << "test_concurrent_reader passed" << std::endl;
}

int main() {
    test_task_results();
    test_ignores_noise();
    test_concurrent_reader();

    std::cout << "All PlaybookOutputParser tests passed!" << std::endl;
    return 0;
}
