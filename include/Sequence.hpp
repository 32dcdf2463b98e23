#pragma once

#include <cstddef>
#include <iterator>
#include <list>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <vector>

/**
 * Sequence - the capability set the benchmark battery needs from a container.
 *
 * Indices are positional. insert_at accepts [0, size()], get_at and
 * remove_at accept [0, size()). Anything else throws std::out_of_range.
 */
class Sequence {
public:
  virtual ~Sequence() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;

  virtual void append(int value) = 0;
  virtual void insert_at(size_t index, int value) = 0;
  [[nodiscard]] virtual int get_at(size_t index) const = 0;
  virtual void remove_at(size_t index) = 0;

  [[nodiscard]] virtual size_t size() const = 0;
  virtual void clear() = 0;

  bool empty() const { return size() == 0; }
};

// Variant A: contiguous storage
class ArraySequence : public Sequence {
private:
  std::vector<int> data;

public:
  std::string_view name() const override { return "std::vector"; }

  void append(int value) override { data.push_back(value); }

  void insert_at(size_t index, int value) override {
    if (index > data.size())
      throw std::out_of_range("insert index past end of sequence");
    data.insert(data.begin() + static_cast<std::ptrdiff_t>(index), value);
  }

  int get_at(size_t index) const override { return data.at(index); }

  void remove_at(size_t index) override {
    if (index >= data.size())
      throw std::out_of_range("remove index past end of sequence");
    data.erase(data.begin() + static_cast<std::ptrdiff_t>(index));
  }

  size_t size() const override { return data.size(); }
  void clear() override { data.clear(); }
};

// Variant B: doubly linked nodes, positional access walks from the nearer end
class LinkedSequence : public Sequence {
private:
  std::list<int> data;

  std::list<int>::iterator node_at(size_t index) {
    if (index <= data.size() / 2)
      return std::next(data.begin(), static_cast<std::ptrdiff_t>(index));
    return std::prev(data.end(),
                     static_cast<std::ptrdiff_t>(data.size() - index));
  }

  std::list<int>::const_iterator node_at(size_t index) const {
    if (index <= data.size() / 2)
      return std::next(data.cbegin(), static_cast<std::ptrdiff_t>(index));
    return std::prev(data.cend(),
                     static_cast<std::ptrdiff_t>(data.size() - index));
  }

public:
  std::string_view name() const override { return "std::list"; }

  void append(int value) override { data.push_back(value); }

  void insert_at(size_t index, int value) override {
    if (index > data.size())
      throw std::out_of_range("insert index past end of sequence");
    data.insert(node_at(index), value);
  }

  int get_at(size_t index) const override {
    if (index >= data.size())
      throw std::out_of_range("read index past end of sequence");
    return *node_at(index);
  }

  void remove_at(size_t index) override {
    if (index >= data.size())
      throw std::out_of_range("remove index past end of sequence");
    data.erase(node_at(index));
  }

  size_t size() const override { return data.size(); }
  void clear() override { data.clear(); }
};

inline std::unique_ptr<Sequence> make_array_sequence() {
  return std::make_unique<ArraySequence>();
}

inline std::unique_ptr<Sequence> make_linked_sequence() {
  return std::make_unique<LinkedSequence>();
}
