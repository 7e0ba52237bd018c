// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/thread/thread_name.h>
#include <atomic>
#include <pthread.h>

namespace hybrid::thread {

namespace {

thread_local std::string current_name;
std::atomic<int> unnamed_threads{0};

} // namespace

const std::string& thread_name() {
  if (current_name.empty()) {
    char name[16]{};
    if (pthread_getname_np(pthread_self(), name, sizeof(name)) == 0 && name[0] != '\0') {
      current_name = name;
    } else {
      current_name = "thread-" + std::to_string(unnamed_threads++);
    }
  }
  return current_name;
}

void set_thread_name(const std::string& name) {
  current_name = name;
  pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
}

} // namespace hybrid::thread
