// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/core/error.h>
#include <boost/outcome/result.hpp>

namespace hybrid {

using namespace BOOST_OUTCOME_V2_NAMESPACE;

// NOTE:
// `Result<T, E>` derived from `boost::outcome_v2::basic_result<T, E>` allows construction from error,
// so an error can be propagated with `return ok.error();`.
// `basic_result` doesn't have a default constructor by its design; a default constructed Result holds T().
// Observing the value of a failed Result throws `bad_result_access_with<E>` carrying the error.
template<typename T, typename E = Error, typename NoValuePolicy = policy::throw_bad_result_access<E, void>>
class Result : public basic_result<T, E, NoValuePolicy> {
public:
  using basic_result<T, E, NoValuePolicy>::basic_result;

  Result(): basic_result<T, E, NoValuePolicy>(T()) {}

  template<typename U>
  Result(std::in_place_type_t<U> _): basic_result<T, E, NoValuePolicy>(_) {}
};

template<typename E, typename NoValuePolicy>
class Result<void, E, NoValuePolicy> : public basic_result<void, E, NoValuePolicy> {
public:
  using basic_result<void, E, NoValuePolicy>::basic_result;

  Result(): basic_result<void, E, NoValuePolicy>(std::in_place_type<void>) {}
};

} // namespace hybrid
