#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "backend/task_service.hpp"
#include "cli/prompter.hpp"
#include "cli/review_session.hpp"
#include "key_registry.hpp"
#include "task.hpp"

namespace tr {

enum class ReviewState { Listing, Editing, Done };

// Pages through one working set. The reviewer owns the tasks for the
// duration of review(); every edit goes through TaskService::update and the
// edited task is re-read from the backend before the loop continues.
class TaskReviewer {
public:
    TaskReviewer(TaskService& svc, const KeyRegistry& keys, Prompter& io, ReviewSession& session)
        : svc_(svc), keys_(keys), io_(io), session_(session) {}

    void review(std::vector<Task> tasks);

    // Tasks as they stand after review(), in working-set order.
    const std::vector<Task>& tasks() const { return tasks_; }

private:
    struct EditStep {
        int delta = 1;
        bool quit = false;
        bool wrote = false; // an update was attempted; refresh before moving on
    };

    ReviewState show_listing(int& index);
    ReviewState edit_at(int& index);
    EditStep edit_task(const Task& task, int index);

    // Write `candidate`; on conflict report it and, if `acknowledge`, wait
    // for a key. Returns true when the import went through.
    bool commit(const Task& candidate, bool acknowledge);
    std::optional<std::string> pick(const std::string& header, const std::string& context);
    std::optional<int> read_jump();
    void bulk_fix();
    void rebuild_visible();

    TaskService& svc_;
    const KeyRegistry& keys_;
    Prompter& io_;
    ReviewSession& session_;

    std::vector<Task> tasks_;
    // Positions into tasks_ shown by the listing; fixed while editing.
    std::vector<std::size_t> visible_;
};

} // namespace tr
