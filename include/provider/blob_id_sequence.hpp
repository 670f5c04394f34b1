#ifndef BLOBSTORE_PROVIDER_BLOB_ID_SEQUENCE_HPP
#define BLOBSTORE_PROVIDER_BLOB_ID_SEQUENCE_HPP

#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <vector>
#include "store/container_client.hpp"

namespace blobstore {
namespace provider {

// Lazy listing of the blob ids of a container. Pages are fetched while
// iterating; every begin() starts a new listing.
class BlobIdSequence {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::string;
    using difference_type = std::ptrdiff_t;
    using pointer = const std::string*;
    using reference = const std::string&;

    iterator() = default;
    explicit iterator(std::shared_ptr<store::BlobNamePager> pager)
      : pager_(std::move(pager)) {
      skip_exhausted_pages();
    }

    reference operator*() const { return pager_->page()[index_]; }
    pointer operator->() const { return &pager_->page()[index_]; }

    iterator& operator++() {
      ++index_;
      skip_exhausted_pages();
      return *this;
    }

    bool operator==(const iterator& other) const {
      return pager_ == other.pager_ && index_ == other.index_;
    }
    bool operator!=(const iterator& other) const { return !(*this == other); }

  private:
    std::shared_ptr<store::BlobNamePager> pager_;
    std::size_t index_{0};

    // Moves to the next page when the current one is consumed; becomes the
    // end iterator when the listing runs out
    void skip_exhausted_pages() {
      while (pager_) {
        if (!pager_->has_page()) {
          pager_.reset();
          index_ = 0;
          return;
        }
        if (index_ < pager_->page().size()) {
          return;
        }
        pager_->move_to_next_page();
        index_ = 0;
      }
    }
  };

  explicit BlobIdSequence(std::shared_ptr<store::ContainerClient> container)
    : container_(std::move(container)) {}

  iterator begin() const { return iterator(std::shared_ptr<store::BlobNamePager>(container_->list_blob_names())); }
  iterator end() const { return iterator(); }

  std::vector<std::string> to_vector() const {
    return std::vector<std::string>(begin(), end());
  }

private:
  std::shared_ptr<store::ContainerClient> container_;
};

} // namespace provider
} // namespace blobstore

#endif // BLOBSTORE_PROVIDER_BLOB_ID_SEQUENCE_HPP
