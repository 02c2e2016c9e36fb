#pragma once

#include <stdexcept>

namespace pullmatch { namespace impl {

/**
 * Exclusive borrow of a cursor held by a strategy handle.
 * Acquired on dispatch, released when the borrow is destroyed.
 */
template <typename Cursor>
class borrow {
  Cursor *owner;
public:
  explicit borrow(Cursor &cursor) : owner(&cursor)
  {
    cursor.lock();
  }

  borrow(borrow &&other) : owner(other.owner)
  {
    other.owner = nullptr;
  }

  borrow(const borrow &) = delete;
  borrow &operator=(const borrow &) = delete;
  borrow &operator=(borrow &&) = delete;

  ~borrow()
  {
    if (owner != nullptr) {
      owner->unlock();
    }
  }

  Cursor &get() const
  {
    if (owner == nullptr) {
      throw std::logic_error("strategy handle already spent: dispatch a new one from the cursor");
    }
    return *owner;
  }
};

}}
