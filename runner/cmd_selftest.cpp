#include "cmd_selftest.h"
#include "runner_utils.h"

#include "labwright/compose.h"
#include "labwright/exec_channel.h"
#include "labwright/json_util.h"
#include "labwright/orchestrator.h"
#include "labwright/self_test.h"
#include "labwright/session.h"
#include "labwright/validator.h"

#include <json-c/json.h>

#include <iostream>
#include <memory>
#include <string>

using namespace labwright;

static json_object* published_to_json(const PublishedLab& v) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "lab_id", json_util::new_string(v.lab_id));
    json_object_object_add(o, "status", json_object_new_string(lab_status_name(v.status)));
    json_object_object_add(o, "jupyter_url", json_util::new_string(v.jupyter_url));
    if (!v.error_message.empty()) {
        json_object_object_add(o, "error", json_util::new_string(v.error_message));
    }
    return o;
}

static void hold_and_stop(SessionRegistry& registry, LabOrchestrator& orch) {
    std::cerr << "[cli] holding " << registry.size() << " lab(s); Ctrl-C to tear down\n";
    hold_until_signal();
    stop_all(registry, orch);
}

int cmd_selftest(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: labwright_cli selftest <blueprint.json> [--hold]\n";
        return 2;
    }
    bool hold = false;
    for (int i = 3; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--hold") { hold = true; continue; }
        std::cerr << "unknown option: " << a << "\n";
        return 2;
    }

    Blueprint bp;
    if (!load_blueprint_file(argv[2], &bp)) return 2;

    LabConfig cfg = load_lab_config();
    auto driver = std::make_shared<DockerComposeDriver>(cfg.docker_bin);
    LabOrchestrator orch(cfg, driver);
    recover_if_configured(cfg, orch);
    ExecutionChannel channel(driver, cfg.script_timeout_ms);
    Validator validator(channel, cfg.query_timeout_s);
    auto repairer = make_repairer(cfg);

    if (hold) install_stop_handlers();

    SelfTestCoordinator coordinator(orch, channel, validator, repairer.get(), self_test_options(cfg));
    SelfTestResult res = coordinator.run(bp);

    std::cout << json_util::to_string_and_put(self_test_result_to_json(res), JSON_C_TO_STRING_PRETTY) << "\n";
    std::cout.flush();

    if (!res.passed) return 1;

    SessionRegistry registry;
    registry.put(std::move(*res.session));
    if (hold) {
        hold_and_stop(registry, orch);
    } else {
        stop_all(registry, orch);
    }
    return 0;
}

int cmd_launch(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: labwright_cli launch <blueprint.json>\n";
        return 2;
    }
    Blueprint bp;
    if (!load_blueprint_file(argv[2], &bp)) return 2;

    LabConfig cfg = load_lab_config();
    auto driver = std::make_shared<DockerComposeDriver>(cfg.docker_bin);
    LabOrchestrator orch(cfg, driver);
    recover_if_configured(cfg, orch);
    install_stop_handlers();

    LabSession s = orch.provision(bp);
    if (s.status == LabStatus::ERROR) {
        std::cout << json_util::to_string_and_put(published_to_json(publish_view(s)), JSON_C_TO_STRING_PRETTY) << "\n";
        return 1;
    }

    auto h = orch.execution_handle(s);
    std::string not_ready = "Source";
    if (!h || !wait_for_databases(*driver, *h, cfg.db_ready_timeout_ms, cfg.db_poll_ms, &not_ready)) {
        s.error_message = not_ready + " database did not become ready in time";
        s.error_kind = ErrorKind::READINESS_TIMEOUT;
        PublishedLab v = publish_view(s);
        if (!orch.teardown(s)) std::cerr << "[cli] teardown of lab " << s.lab_id << ": " << s.error_message << "\n";
        v.status = LabStatus::ERROR;
        std::cout << json_util::to_string_and_put(published_to_json(v), JSON_C_TO_STRING_PRETTY) << "\n";
        return 1;
    }

    SessionRegistry registry;
    const std::string lab_id = s.lab_id;
    registry.put(std::move(s));
    if (auto v = registry.view(lab_id)) {
        std::cout << json_util::to_string_and_put(published_to_json(*v), JSON_C_TO_STRING_PRETTY) << "\n";
        std::cout.flush();
    }
    hold_and_stop(registry, orch);
    return 0;
}
