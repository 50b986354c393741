/*
 * Copyright 2016 Google Inc.
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

#ifndef NET_CDNMIRROR_REWRITER_PUBLIC_CDN_HOOK_REGISTRY_H_
#define NET_CDNMIRROR_REWRITER_PUBLIC_CDN_HOOK_REGISTRY_H_

#include <map>
#include <vector>

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/callback.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"
#include "net/cdnmirror/rewriter/public/image_url_rewriter.h"

namespace net_cdnmirror {

class MessageHandler;
class Writer;

// Ordered list of the handlers a host page renderer calls at named points
// ("hooks") while it builds a page.  A filter hook passes a value through
// each of its filters in turn; an action hook lets each of its actions
// write to the response.  Image hooks are filter hooks whose value is a
// typed image record, which each filter edits in place.  Handlers run in
// ascending priority, and in registration order when priorities are equal.
class CdnHookRegistry {
 public:
  // Run(in, out) sets *out to the filtered value of in.
  typedef Callback2<const StringPiece&, GoogleString*> FilterCallback;
  typedef Callback2<Writer*, MessageHandler*> ActionCallback;
  typedef Callback1<ImageSource*> ImageSourceCallback;
  typedef Callback1<SrcsetCandidateVector*> SrcsetCallback;

  CdnHookRegistry();
  ~CdnHookRegistry();

  // Takes ownership of the callback, which must be permanent.
  void AddFilter(const StringPiece& hook, int priority,
                 FilterCallback* filter);
  void AddAction(const StringPiece& hook, int priority,
                 ActionCallback* action);
  void AddImageSourceFilter(const StringPiece& hook, int priority,
                            ImageSourceCallback* filter);
  void AddSrcsetFilter(const StringPiece& hook, int priority,
                       SrcsetCallback* filter);

  // Returns value as transformed by every filter on hook.
  GoogleString ApplyFilters(const StringPiece& hook,
                            const StringPiece& value) const;

  // Passes *image, or each candidate list in *candidates, through every
  // image filter of the matching type on hook.
  void ApplyImageSourceFilters(const StringPiece& hook,
                               ImageSource* image) const;
  void ApplySrcsetFilters(const StringPiece& hook,
                          SrcsetCandidateVector* candidates) const;

  // Runs every action on hook.
  void DoAction(const StringPiece& hook, Writer* writer,
                MessageHandler* handler) const;

  // Number of handlers of any kind registered on hook.
  int NumHandlers(const StringPiece& hook) const;

  // Priority of the first handler on hook, or -1 if it has none.
  int FirstPriority(const StringPiece& hook) const;

 private:
  struct Registration {
    // Exactly one of the callbacks is set, by the caller.
    explicit Registration(int p)
        : priority(p), filter(NULL), action(NULL), image_source(NULL),
          srcset(NULL) {}
    ~Registration();

    int priority;
    FilterCallback* filter;
    ActionCallback* action;
    ImageSourceCallback* image_source;
    SrcsetCallback* srcset;

   private:
    DISALLOW_COPY_AND_ASSIGN(Registration);
  };
  typedef std::vector<Registration*> RegistrationVector;
  typedef std::map<GoogleString, RegistrationVector> HookMap;

  void Add(const StringPiece& hook, Registration* registration);
  const RegistrationVector* Find(const StringPiece& hook) const;

  static bool ComparePriority(const Registration* a, const Registration* b);

  HookMap hooks_;

  DISALLOW_COPY_AND_ASSIGN(CdnHookRegistry);
};

}  // namespace net_cdnmirror

#endif  // NET_CDNMIRROR_REWRITER_PUBLIC_CDN_HOOK_REGISTRY_H_
