/*
 * Copyright 2011 Google Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef CDNMIRROR_KERNEL_BASE_SCOPED_PTR_H_
#define CDNMIRROR_KERNEL_BASE_SCOPED_PTR_H_

#include "base/memory/scoped_ptr.h"

namespace net_cdnmirror {

template<typename T> class scoped_ptr : public ::scoped_ptr<T> {
 public:
  scoped_ptr() {}
  explicit scoped_ptr(T* ptr) : ::scoped_ptr<T>(ptr) {}
};

}  // namespace net_cdnmirror

#endif  // CDNMIRROR_KERNEL_BASE_SCOPED_PTR_H_
