#include <iostream>
#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include "agentswarm/engine/core.hpp"
#include "agentswarm/engine/cancellation.hpp"
#include "agentswarm/engine/errors.hpp"
#include "agentswarm/engine/mailbox.hpp"
#include "agentswarm/engine/result_converter.hpp"
#include "agentswarm/engine/retry_policy.hpp"

using namespace agentswarm::engine;

void test_task_defaults() {
    std::cout << "Testing Task defaults..." << std::endl;

    Task task;
    task.id = "t1";
    task.description = "Summarize the quarterly numbers";
    task.payload = {{"quarter", "Q3"}};
    task.context["step1_output"] = "previous output";
    task.dependencies = {"t0"};

    assert(task.priority == 0);
    assert(task.payload["quarter"] == "Q3");
    assert(task.context.at("step1_output") == "previous output");
    assert(task.dependencies.size() == 1);

    auto msg = Message::for_task("coordinator", "a1", task);
    assert(msg.type == MessageType::task);
    assert(msg.sender == "coordinator");
    assert(msg.recipient == "a1");
    assert(std::get<Task>(msg.payload).id == "t1");

    std::cout << "✓ Task defaults test passed" << std::endl;
}

void test_result_factories() {
    std::cout << "Testing Result factory methods..." << std::endl;

    auto ok = Result::ok_result("t1", "done", "a1", 12);
    assert(ok.success());
    assert(!ok.is_error());
    assert(ok.error_code == ErrorCode::none);
    assert(ok.data == "done");
    assert(ok.actor_id == "a1");
    assert(ok.latency_ms == 12);

    auto err = Result::error_result("t2", ErrorCode::execution_failed, "boom");
    assert(!err.success());
    assert(err.is_error());
    assert(err.error_code == ErrorCode::execution_failed);
    assert(err.data == "boom");

    auto timeout = Result::timeout_result("t3", 250);
    assert(timeout.is_timeout());
    assert(!timeout.is_error());
    assert(timeout.error_code == ErrorCode::step_timeout);
    assert(timeout.data == "Task timeout after 250ms");
    assert(timeout.actor_id.empty());

    auto cancelled = Result::cancelled_result("t4", "bus closed");
    assert(cancelled.is_cancelled());
    assert(cancelled.error_code == ErrorCode::cancelled);

    std::cout << "✓ Result factory methods test passed" << std::endl;
}

void test_event_terminal_kinds() {
    std::cout << "Testing Event terminal kinds..." << std::endl;

    Event event;
    event.kind = EventKind::task_started;
    assert(!event.is_terminal());
    assert(event.result() == nullptr);

    event.kind = EventKind::task_completed;
    event.data = Result::ok_result("t1", "x");
    assert(event.is_terminal());
    assert(event.result() != nullptr);
    assert(event.result()->task_id == "t1");

    event.kind = EventKind::task_failed;
    assert(event.is_terminal());

    event.kind = EventKind::custom;
    assert(!event.is_terminal());

    std::cout << "✓ Event terminal kinds test passed" << std::endl;
}

void test_result_converter() {
    std::cout << "Testing ResultConverter..." << std::endl;

    assert(ResultConverter::status_to_string(ResultStatus::ok) == "success");
    assert(ResultConverter::status_to_string(ResultStatus::timeout) == "timeout");
    assert(ResultConverter::error_code_to_string(ErrorCode::step_timeout) == "STEP_TIMEOUT");
    assert(ResultConverter::error_code_to_string(ErrorCode::handler_failed) == "HANDLER_FAILED");
    assert(ResultConverter::state_to_string(ActorState::processing) == "processing");

    auto json_ok = ResultConverter::to_json(Result::ok_result("t1", "done", "a1", 5));
    assert(json_ok["task_id"] == "t1");
    assert(json_ok["status"] == "success");
    assert(json_ok["success"] == true);
    assert(json_ok["actor_id"] == "a1");
    assert(!json_ok.contains("error_code"));

    auto json_err = ResultConverter::to_json(Result::timeout_result("t2", 100));
    assert(json_err["success"] == false);
    assert(json_err["error_code"] == "STEP_TIMEOUT");
    assert(!json_err.contains("actor_id"));

    std::map<std::string, ActorState> status = {
        {"a1", ActorState::processing},
        {"a2", ActorState::stopped}
    };
    auto json_status = ResultConverter::to_json(status);
    assert(json_status["a1"] == "processing");
    assert(json_status["a2"] == "stopped");

    Event event;
    event.kind = EventKind::task_failed;
    event.actor_id = "a1";
    event.task_id = "t9";
    event.message = "Task failed";
    event.data = Result::error_result("t9", ErrorCode::handler_failed, "bad");
    auto json_event = ResultConverter::to_json(event);
    assert(json_event["type"] == "task_failed");
    assert(json_event["agent_id"] == "a1");
    assert(json_event["data"]["error_code"] == "HANDLER_FAILED");

    std::cout << "✓ ResultConverter test passed" << std::endl;
}

void test_swarm_errors() {
    std::cout << "Testing swarm error category..." << std::endl;

    auto err = make_error(swarm_errc::mailbox_full, "actor a1 mailbox is full");
    assert(err);
    assert(err.category() == swarm_error_category);
    assert(is(err, swarm_errc::mailbox_full));
    assert(!is(err, swarm_errc::stopped));
    assert(error_context(err) == "actor a1 mailbox is full");
    assert(describe(err) == "mailbox_full: actor a1 mailbox is full");

    auto bare = make_error(swarm_errc::not_found);
    assert(error_context(bare).empty());
    assert(describe(bare) == "not_found");

    assert(to_string(swarm_errc::duplicate_id) == "duplicate_id");
    assert(to_string(swarm_errc::multiple_failures) == "multiple_failures");

    caf::error none;
    assert(!is(none, swarm_errc::mailbox_full));

    std::cout << "✓ Swarm error category test passed" << std::endl;
}

void test_retry_policy() {
    std::cout << "Testing RetryPolicy..." << std::endl;

    RetryPolicy::Config config;
    config.base_delay_ms = 100;
    config.max_delay_ms = 1000;
    config.total_timeout_ms = 3000;
    config.max_retries = 4;
    RetryPolicy policy(config);

    assert(policy.calculate_backoff_delay(0) == 100);
    assert(policy.calculate_backoff_delay(1) == 200);
    assert(policy.calculate_backoff_delay(3) == 800);
    assert(policy.calculate_backoff_delay(4) == 1000);
    assert(policy.calculate_backoff_delay(40) == 1000);

    assert(policy.is_retryable(make_error(swarm_errc::mailbox_full)));
    assert(policy.is_retryable(make_error(swarm_errc::completion_failed)));
    assert(!policy.is_retryable(make_error(swarm_errc::stopped)));
    assert(!policy.is_retryable(make_error(swarm_errc::no_available_actor)));
    assert(policy.is_retryable(make_error(swarm_errc::http_error), 429));
    assert(policy.is_retryable(make_error(swarm_errc::http_error), 503));
    assert(!policy.is_retryable(make_error(swarm_errc::http_error), 401));

    assert(!policy.is_budget_exhausted(0, 0));
    assert(policy.is_budget_exhausted(2950, 0));
    assert(policy.is_budget_exhausted(3000, 0));
    assert(policy.max_retries() == 4);

    std::cout << "✓ RetryPolicy test passed" << std::endl;
}

void test_bounded_mailbox() {
    std::cout << "Testing BoundedMailbox..." << std::endl;

    BoundedMailbox<int> mailbox(2);
    assert(mailbox.try_push(1) == BoundedMailbox<int>::push_result::accepted);
    assert(mailbox.try_push(2) == BoundedMailbox<int>::push_result::accepted);
    assert(mailbox.try_push(3) == BoundedMailbox<int>::push_result::full);
    assert(mailbox.size() == 2);

    auto first = mailbox.try_pop();
    assert(first && *first == 1);

    mailbox.close();
    assert(mailbox.try_push(4) == BoundedMailbox<int>::push_result::closed);

    // Items queued before close can still be drained
    auto second = mailbox.pop_for(std::chrono::milliseconds(10));
    assert(second && *second == 2);
    assert(!mailbox.try_pop());
    assert(!mailbox.pop_for(std::chrono::milliseconds(10)));

    std::cout << "✓ BoundedMailbox test passed" << std::endl;
}

void test_mailbox_wait_pop_cancellation() {
    std::cout << "Testing BoundedMailbox wait_pop cancellation..." << std::endl;

    auto mailbox = std::make_shared<BoundedMailbox<int>>(4);
    auto scope = CancellationScope::make_root();
    scope->on_cancel([mailbox] { mailbox->wake(); });

    bool returned_empty = false;
    std::thread consumer([&] {
        auto item = mailbox->wait_pop(*scope);
        returned_empty = !item;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    scope->cancel();
    consumer.join();
    assert(returned_empty);

    std::cout << "✓ BoundedMailbox wait_pop cancellation test passed" << std::endl;
}

void test_cancellation_hierarchy() {
    std::cout << "Testing CancellationScope hierarchy..." << std::endl;

    auto root = CancellationScope::make_root();
    auto child = root->derive();
    auto grandchild = child->derive();
    auto sibling = root->derive();

    int fired = 0;
    grandchild->on_cancel([&fired] { fired++; });

    // Cancelling a child leaves parent and siblings alone
    child->cancel();
    assert(child->is_cancelled());
    assert(grandchild->is_cancelled());
    assert(!root->is_cancelled());
    assert(!sibling->is_cancelled());
    assert(fired == 1);

    // Idempotent
    child->cancel();
    assert(fired == 1);

    root->cancel();
    assert(sibling->is_cancelled());

    // Derived from a cancelled scope -> already cancelled
    auto late = root->derive();
    assert(late->is_cancelled());

    // Callback registered after cancellation runs immediately
    bool ran = false;
    auto id = late->on_cancel([&ran] { ran = true; });
    assert(ran);
    assert(id == 0);

    std::cout << "✓ CancellationScope hierarchy test passed" << std::endl;
}

void test_cancellation_removed_callback() {
    std::cout << "Testing CancellationScope callback removal..." << std::endl;

    auto root = CancellationScope::make_root();
    bool ran = false;
    auto id = root->on_cancel([&ran] { ran = true; });
    root->remove_callback(id);
    root->cancel();
    assert(!ran);

    // A destroyed child unhooks itself from its parent
    auto parent = CancellationScope::make_root();
    {
        auto child = parent->derive();
    }
    parent->cancel();
    assert(parent->is_cancelled());

    std::cout << "✓ CancellationScope callback removal test passed" << std::endl;
}

int main() {
    std::cout << "Running core tests..." << std::endl;

    test_task_defaults();
    test_result_factories();
    test_event_terminal_kinds();
    test_result_converter();
    test_swarm_errors();
    test_retry_policy();
    test_bounded_mailbox();
    test_mailbox_wait_pop_cancellation();
    test_cancellation_hierarchy();
    test_cancellation_removed_callback();

    std::cout << "All core tests passed!" << std::endl;
    return 0;
}
