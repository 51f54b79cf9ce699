/*
 * kanboard C++ - Task search
 * 
 * Lazy, restartable sequence of tasks whose title, description or context
 * contains the query (ASCII case-insensitive). Iteration walks a snapshot
 * of the board taken when the search was created and matches on demand;
 * begin() may be called any number of times.
 */
#ifndef kanboard_BOARD_SEARCH_HPP
#define kanboard_BOARD_SEARCH_HPP

#include <kanboard/board/model.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace kanboard {

bool task_matches(const Task& task, const std::string& query);

class TaskSearch {
public:
    class const_iterator {
    public:
        typedef std::forward_iterator_tag iterator_category;
        typedef Task value_type;
        typedef std::ptrdiff_t difference_type;
        typedef const Task* pointer;
        typedef const Task& reference;
        
        const_iterator() : owner_(nullptr), pos_(0) {}
        
        reference operator*() const;
        pointer operator->() const { return &**this; }
        const_iterator& operator++();
        const_iterator operator++(int);
        
        bool operator==(const const_iterator& other) const {
            return owner_ == other.owner_ && pos_ == other.pos_;
        }
        bool operator!=(const const_iterator& other) const { return !(*this == other); }
        
        // Column holding the current task
        const std::string& column() const;
        
    private:
        friend class TaskSearch;
        const_iterator(const TaskSearch* owner, size_t pos);
        void skip_to_match();
        
        const TaskSearch* owner_;
        size_t pos_;
    };
    
    TaskSearch() {}
    TaskSearch(std::shared_ptr<const Board> snapshot, const std::string& query);
    
    const_iterator begin() const;
    const_iterator end() const;
    
    const std::string& query() const { return query_; }
    const Board& board() const { return *snapshot_; }
    
    // Drains the sequence
    size_t count() const;

private:
    struct Entry {
        const Task* task;
        std::string column;
    };
    
    std::shared_ptr<const Board> snapshot_;
    std::string query_;
    std::vector<Entry> order_;      // display order, unfiltered
};

} // namespace kanboard

#endif // kanboard_BOARD_SEARCH_HPP
