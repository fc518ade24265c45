#pragma once
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>
#include "vector.hpp"

// Ternary heap backed by DynArray<T>.
//
// order(a, b) == true means a belongs closer to the root than b, so the
// default std::less<T> gives a min-heap. Slot i has its parent at (i-1)/3
// and its children at 3i+1, 3i+2, 3i+3. Among equally ranked children the
// leftmost wins, but callers should not rely on that.
template <typename T, typename Compare = std::less<T>>
class TernaryHeap
{
public:
    static constexpr std::size_t arity = 3;
    static constexpr std::size_t default_capacity = 10;
    static constexpr double default_growth = 2.0;

    static constexpr std::size_t parent_of(std::size_t i) { return (i - 1) / arity; }
    static constexpr std::size_t first_child_of(std::size_t i) { return arity * i + 1; }

    class AscendingRange;

    // Throws std::invalid_argument when growth <= 1.
    explicit TernaryHeap(Compare order = Compare(),
                         std::size_t initial_capacity = default_capacity,
                         double growth = default_growth)
        : order_(std::move(order)), a_(growth)
    {
        a_.reserve(initial_capacity);
    }

    // Bulk build: adopts the elements (capacity == elements.size()) and
    // heapifies in O(n).
    static TernaryHeap from_unordered(std::vector<T> elements,
                                      Compare order = Compare(),
                                      double growth = default_growth)
    {
        TernaryHeap h(std::move(order), 0, growth);
        h.a_.reserve(elements.size());
        for (auto &e : elements)
            h.a_.push_back(std::move(e));
        h.heapify_();
        return h;
    }

    template <class ForwardIt>
    static TernaryHeap from_unordered(ForwardIt first, ForwardIt last,
                                      Compare order = Compare(),
                                      double growth = default_growth)
    {
        TernaryHeap h(std::move(order), 0, growth);
        h.a_.reserve(static_cast<std::size_t>(std::distance(first, last)));
        for (; first != last; ++first)
            h.a_.push_back(*first);
        h.heapify_();
        return h;
    }

    // Returns the element in the slot it settled in. The reference is
    // invalidated by the next mutation.
    const T &push(const T &v)
    {
        a_.push_back(v);
        return a_[sift_up_(a_.size() - 1)];
    }
    const T &push(T &&v)
    {
        a_.push_back(std::move(v));
        return a_[sift_up_(a_.size() - 1)];
    }

    template <class... Args>
    const T &emplace(Args &&...args)
    {
        a_.emplace_back(std::forward<Args>(args)...);
        return a_[sift_up_(a_.size() - 1)];
    }

    // Appends a batch. Rebuilds from scratch when the batch outnumbers the
    // existing elements, otherwise sifts each new element up.
    template <class InputIt>
    void push_range(InputIt first, InputIt last)
    {
        const std::size_t before = a_.size();
        for (; first != last; ++first)
            a_.push_back(*first);
        const std::size_t added = a_.size() - before;
        if (added > before)
        {
            heapify_();
            return;
        }
        for (std::size_t i = before; i < a_.size(); ++i)
            sift_up_(i);
    }

    std::optional<T> peek() const
    {
        if (a_.empty())
            return std::nullopt;
        return a_[0];
    }

    // Precondition: !empty().
    const T &top() const { return a_[0]; }

    std::optional<T> pop()
    {
        if (a_.empty())
            return std::nullopt;
        std::optional<T> out(std::move(a_[0]));
        remove_root_();
        return out;
    }

    // Replaces the first element (in storage order, not priority order) that
    // satisfies match. Returns false when nothing matches.
    template <class Pred>
    bool modify(Pred &&match, T value)
    {
        for (std::size_t i = 0; i < a_.size(); ++i)
        {
            if (!match(static_cast<const T &>(a_[i])))
                continue;
            const bool raised = order_(value, a_[i]);
            a_[i] = std::move(value);
            if (raised)
                sift_up_(i);
            else
                sift_down_(i);
            return true;
        }
        return false;
    }

    // Pools the live elements of *this and others into a fresh heap that uses
    // this heap's comparator and growth factor. Inputs are left untouched.
    template <class... Heaps>
    TernaryHeap merge(const Heaps &...others) const
    {
        static_assert((std::is_same_v<Heaps, TernaryHeap> && ...),
                      "merge expects heaps of the same type");
        TernaryHeap out(order_, 0, a_.growth());
        out.a_.reserve((a_.size() + ... + others.size()));
        out.append_live_(*this);
        (out.append_live_(others), ...);
        out.heapify_();
        return out;
    }

    // Returns the number of elements dropped. Capacity is kept.
    std::size_t clear()
    {
        const std::size_t n = a_.size();
        a_.clear();
        return n;
    }

    TernaryHeap clone() const { return *this; }

    void swap(TernaryHeap &o) noexcept(std::is_nothrow_swappable_v<Compare>)
    {
        using std::swap;
        swap(order_, o.order_);
        a_.swap(o.a_);
    }

    // Snapshot of the current contents, drained in priority order.
    AscendingRange ascending() const { return AscendingRange(*this); }

    void reserve(std::size_t n) { a_.reserve(n); }

    std::size_t size() const { return a_.size(); }
    bool empty() const { return a_.empty(); }
    std::size_t capacity() const { return a_.capacity(); }
    double growth_factor() const { return a_.growth(); }
    const Compare &ordering() const { return order_; }
    const DynArray<T> &storage() const { return a_; }

    bool is_heap() const
    {
        for (std::size_t i = 1; i < a_.size(); ++i)
            if (order_(a_[i], a_[parent_of(i)]))
                return false;
        return true;
    }

private:
    void remove_root_()
    {
        if (a_.size() > 1)
            a_[0] = std::move(a_.back());
        a_.pop_back();
        if (a_.size() > 1)
            sift_down_(0);
    }

    std::size_t sift_up_(std::size_t i)
    {
        while (i > 0)
        {
            std::size_t p = parent_of(i);
            if (!order_(a_[i], a_[p]))
                break;
            std::swap(a_[p], a_[i]);
            i = p;
        }
        return i;
    }

    void sift_down_(std::size_t i)
    {
        const std::size_t n = a_.size();
        for (;;)
        {
            std::size_t c = first_child_of(i);
            if (c >= n)
                break;
            std::size_t best = c;
            const std::size_t last = c + arity < n ? c + arity : n;
            for (++c; c < last; ++c)
                if (order_(a_[c], a_[best]))
                    best = c;
            if (!order_(a_[best], a_[i]))
                break;
            std::swap(a_[i], a_[best]);
            i = best;
        }
    }

    // Bottom-up heapify. Starting at (n-1)/3 also visits a few leaves, which
    // sift_down_ leaves alone.
    void heapify_()
    {
        const std::size_t n = a_.size();
        if (n < 2)
            return;
        for (std::size_t i = (n - 1) / arity + 1; i-- > 0;)
            sift_down_(i);
    }

    void append_live_(const TernaryHeap &h)
    {
        for (const T &v : h.a_)
            a_.push_back(v);
    }

    Compare order_;
    DynArray<T> a_;
};

// Single-pass range over a private copy of the heap. Each increment pops
// the copy; the source heap is never touched.
template <typename T, typename Compare>
class TernaryHeap<T, Compare>::AscendingRange
{
public:
    class iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T *;
        using reference = const T &;

        iterator() : h_(nullptr) {}
        explicit iterator(TernaryHeap *h) : h_(h->empty() ? nullptr : h) {}

        reference operator*() const { return h_->top(); }
        pointer operator->() const { return &h_->top(); }

        iterator &operator++()
        {
            h_->remove_root_();
            if (h_->empty())
                h_ = nullptr;
            return *this;
        }

        bool operator==(const iterator &o) const { return h_ == o.h_; }
        bool operator!=(const iterator &o) const { return h_ != o.h_; }

    private:
        TernaryHeap *h_;
    };

    explicit AscendingRange(TernaryHeap snapshot) : snap_(std::move(snapshot)) {}

    iterator begin() { return iterator(&snap_); }
    iterator end() { return iterator(); }

    // Elements not yet yielded.
    std::size_t size() const { return snap_.size(); }

private:
    TernaryHeap snap_;
};
