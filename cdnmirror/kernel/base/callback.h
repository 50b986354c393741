/*
 * Copyright 2013 Google Inc.
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

#ifndef CDNMIRROR_KERNEL_BASE_CALLBACK_H_
#define CDNMIRROR_KERNEL_BASE_CALLBACK_H_

#include "cdnmirror/kernel/base/basictypes.h"

namespace net_cdnmirror {

// A closure taking one argument at run time.  Ownership is as for
// Callback2 below.
template<class A1>
class Callback1 {
 public:
  Callback1() {}
  virtual ~Callback1() {}
  virtual void Run(A1 a1) = 0;

 private:
  DISALLOW_COPY_AND_ASSIGN(Callback1);
};

template<class C, class A1>
class MemberCallback1 : public Callback1<A1> {
 public:
  typedef void (C::*MemberSignature)(A1);

  MemberCallback1(C* object, MemberSignature member)
      : object_(object),
        member_(member) {
  }

  virtual void Run(A1 a1) {
    (object_->*member_)(a1);
  }

 private:
  C* object_;
  MemberSignature member_;
};

template<class C, class A1>
Callback1<A1>* NewPermanentCallback(C* object, void (C::*member)(A1)) {
  return new MemberCallback1<C, A1>(object, member);
}

// A closure taking two arguments at run time.  Run may be called any
// number of times; the owner deletes the callback when done with it.
//
//   class Filter {
//    public:
//     void Apply(const StringPiece& in, GoogleString* out);
//   };
//
//   Callback2<const StringPiece&, GoogleString*>* cb =
//       NewPermanentCallback(&filter, &Filter::Apply);
//   GoogleString out;
//   cb->Run("in", &out);
//   delete cb;
template<class A1, class A2>
class Callback2 {
 public:
  Callback2() {}
  virtual ~Callback2() {}
  virtual void Run(A1 a1, A2 a2) = 0;

 private:
  DISALLOW_COPY_AND_ASSIGN(Callback2);
};

// Binds an object to one of its two-argument member functions.
template<class C, class A1, class A2>
class MemberCallback2 : public Callback2<A1, A2> {
 public:
  typedef void (C::*MemberSignature)(A1, A2);

  MemberCallback2(C* object, MemberSignature member)
      : object_(object),
        member_(member) {
  }

  virtual void Run(A1 a1, A2 a2) {
    (object_->*member_)(a1, a2);
  }

 private:
  C* object_;
  MemberSignature member_;
};

template<class C, class A1, class A2>
Callback2<A1, A2>* NewPermanentCallback(C* object,
                                        void (C::*member)(A1, A2)) {
  return new MemberCallback2<C, A1, A2>(object, member);
}

}  // namespace net_cdnmirror

#endif  // CDNMIRROR_KERNEL_BASE_CALLBACK_H_
