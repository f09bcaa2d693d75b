//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/tl/ErrorKind.h"
#include "mtk/tl/tl_parsers.h"

#include "mtk/utils/common.h"
#include "mtk/utils/format.h"
#include "mtk/utils/Slice.h"
#include "mtk/utils/StringBuilder.h"
#include "mtk/utils/Variant.h"

#include <array>
#include <type_traits>
#include <utility>

namespace mtk {

/*
 * Boxed TL type with several constructors, stored by value.
 *
 * class Peer final : public TlUnion<Peer, peerUser, peerChat, peerChannel> {
 *  public:
 *   using TlUnion::TlUnion;
 *   static Slice type_name() {
 *     return Slice("Peer");
 *   }
 * };
 *
 * Each alternative has a `static constexpr int32 ID` and an explicit constructor from TlParser,
 * which reads the bare constructor body. Constructing the union from a TlParser reads the
 * constructor identifier and dispatches through a table with one entry per alternative.
 */
template <class Derived, class... Types>
class TlUnion {
  using VariantT = Variant<Types...>;

 public:
  TlUnion() = default;

  template <class T, std::enable_if_t<VariantT::template offset<T>() != VariantT::npos, int> = 0>
  TlUnion(T &&value) : variant_(std::forward<T>(value)) {
  }

  explicit TlUnion(TlParser &parser) {
    auto constructor_id = parser.fetch_int();
    if (parser.has_error()) {
      return;
    }
    for (auto &entry : get_table()) {
      if (entry.id == constructor_id) {
        entry.parse(variant_, parser);
        if (parser.has_error()) {
          variant_.clear();
        }
        return;
      }
    }

    StringBuilder sb;
    sb << "Unknown constructor " << format::as_hex(constructor_id) << " for " << Derived::type_name()
       << ", expected one of {";
    bool is_first = true;
    for (auto &entry : get_table()) {
      if (!is_first) {
        sb << ", ";
      }
      sb << format::as_hex(entry.id);
      is_first = false;
    }
    sb << '}';
    parser.set_error(ErrorKind::UnknownConstructor, sb.as_cslice());
  }

  bool empty() const {
    return variant_.empty();
  }

  // position of the active alternative in Types, or -1
  int32 get_offset() const {
    return variant_.get_offset();
  }

  int32 get_id() const {
    int32 id = 0;
    variant_.visit([&id](const auto &value) { id = std::decay_t<decltype(value)>::ID; });
    return id;
  }

  template <class T>
  bool is() const {
    return variant_.template is<T>();
  }

  template <class T>
  T &get() {
    return variant_.template get<T>();
  }
  template <class T>
  const T &get() const {
    return variant_.template get<T>();
  }

  template <class F>
  void visit(F &&f) const {
    variant_.visit(std::forward<F>(f));
  }

  template <class StorerT>
  void store(StorerT &s) const {
    CHECK(!empty());
    variant_.visit([&s](const auto &value) {
      s.store_binary(std::decay_t<decltype(value)>::ID);
      value.store(s);
    });
  }

 private:
  VariantT variant_;

  struct Entry {
    int32 id;
    void (*parse)(VariantT &variant, TlParser &parser);
  };

  template <class T>
  static void parse_alternative(VariantT &variant, TlParser &parser) {
    variant = T(parser);
  }

  static const std::array<Entry, sizeof...(Types)> &get_table() {
    static const std::array<Entry, sizeof...(Types)> table{{Entry{Types::ID, &parse_alternative<Types>}...}};
    return table;
  }
};

}  // namespace mtk
