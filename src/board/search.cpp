/*
 * kanboard C++ - Task search
 */
#include <kanboard/board/search.hpp>
#include <kanboard/core/utils.hpp>

namespace kanboard {

bool task_matches(const Task& task, const std::string& query) {
    if (query.empty()) return true;
    return contains_icase(task.title, query) ||
           contains_icase(task.description, query) ||
           contains_icase(task.context, query);
}

TaskSearch::TaskSearch(std::shared_ptr<const Board> snapshot, const std::string& query)
    : snapshot_(snapshot)
    , query_(query) {
    for (size_t c = 0; c < snapshot_->columns.size(); ++c) {
        const Column& col = snapshot_->columns[c];
        for (size_t i = 0; i < col.task_ids.size(); ++i) {
            const Task* t = snapshot_->find_task(col.task_ids[i]);
            if (!t) continue;
            Entry e;
            e.task = t;
            e.column = col.name;
            order_.push_back(e);
        }
    }
}

TaskSearch::const_iterator TaskSearch::begin() const {
    return const_iterator(this, 0);
}

TaskSearch::const_iterator TaskSearch::end() const {
    return const_iterator(this, order_.size());
}

size_t TaskSearch::count() const {
    size_t n = 0;
    for (const_iterator it = begin(); it != end(); ++it) ++n;
    return n;
}

// ----------------------------------------------------------------------------

TaskSearch::const_iterator::const_iterator(const TaskSearch* owner, size_t pos)
    : owner_(owner), pos_(pos) {
    skip_to_match();
}

void TaskSearch::const_iterator::skip_to_match() {
    while (pos_ < owner_->order_.size() &&
           !task_matches(*owner_->order_[pos_].task, owner_->query_)) {
        ++pos_;
    }
}

TaskSearch::const_iterator::reference TaskSearch::const_iterator::operator*() const {
    return *owner_->order_[pos_].task;
}

const std::string& TaskSearch::const_iterator::column() const {
    return owner_->order_[pos_].column;
}

TaskSearch::const_iterator& TaskSearch::const_iterator::operator++() {
    ++pos_;
    skip_to_match();
    return *this;
}

TaskSearch::const_iterator TaskSearch::const_iterator::operator++(int) {
    const_iterator prev = *this;
    ++(*this);
    return prev;
}

} // namespace kanboard
