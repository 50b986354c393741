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

#include "net/cdnmirror/rewriter/public/cdn_hook_registry.h"

#include <algorithm>

#include "cdnmirror/kernel/base/stl_util.h"

namespace net_cdnmirror {

CdnHookRegistry::Registration::~Registration() {
  delete filter;
  delete action;
  delete image_source;
  delete srcset;
}

CdnHookRegistry::CdnHookRegistry() {
}

CdnHookRegistry::~CdnHookRegistry() {
  for (HookMap::iterator p = hooks_.begin(), e = hooks_.end(); p != e; ++p) {
    STLDeleteElements(&p->second);
  }
}

bool CdnHookRegistry::ComparePriority(const Registration* a,
                                      const Registration* b) {
  return a->priority < b->priority;
}

void CdnHookRegistry::Add(const StringPiece& hook,
                          Registration* registration) {
  RegistrationVector& registrations = hooks_[hook.as_string()];
  registrations.push_back(registration);
  std::stable_sort(registrations.begin(), registrations.end(),
                   ComparePriority);
}

void CdnHookRegistry::AddFilter(const StringPiece& hook, int priority,
                                FilterCallback* filter) {
  Registration* registration = new Registration(priority);
  registration->filter = filter;
  Add(hook, registration);
}

void CdnHookRegistry::AddAction(const StringPiece& hook, int priority,
                                ActionCallback* action) {
  Registration* registration = new Registration(priority);
  registration->action = action;
  Add(hook, registration);
}

void CdnHookRegistry::AddImageSourceFilter(const StringPiece& hook,
                                           int priority,
                                           ImageSourceCallback* filter) {
  Registration* registration = new Registration(priority);
  registration->image_source = filter;
  Add(hook, registration);
}

void CdnHookRegistry::AddSrcsetFilter(const StringPiece& hook, int priority,
                                      SrcsetCallback* filter) {
  Registration* registration = new Registration(priority);
  registration->srcset = filter;
  Add(hook, registration);
}

const CdnHookRegistry::RegistrationVector* CdnHookRegistry::Find(
    const StringPiece& hook) const {
  HookMap::const_iterator p = hooks_.find(hook.as_string());
  return (p == hooks_.end()) ? NULL : &p->second;
}

GoogleString CdnHookRegistry::ApplyFilters(const StringPiece& hook,
                                           const StringPiece& value) const {
  GoogleString result;
  value.CopyToString(&result);
  const RegistrationVector* registrations = Find(hook);
  if (registrations != NULL) {
    for (int i = 0, n = registrations->size(); i < n; ++i) {
      FilterCallback* filter = (*registrations)[i]->filter;
      if (filter != NULL) {
        GoogleString filtered;
        filter->Run(result, &filtered);
        result.swap(filtered);
      }
    }
  }
  return result;
}

void CdnHookRegistry::ApplyImageSourceFilters(const StringPiece& hook,
                                              ImageSource* image) const {
  const RegistrationVector* registrations = Find(hook);
  if (registrations != NULL) {
    for (int i = 0, n = registrations->size(); i < n; ++i) {
      ImageSourceCallback* filter = (*registrations)[i]->image_source;
      if (filter != NULL) {
        filter->Run(image);
      }
    }
  }
}

void CdnHookRegistry::ApplySrcsetFilters(
    const StringPiece& hook, SrcsetCandidateVector* candidates) const {
  const RegistrationVector* registrations = Find(hook);
  if (registrations != NULL) {
    for (int i = 0, n = registrations->size(); i < n; ++i) {
      SrcsetCallback* filter = (*registrations)[i]->srcset;
      if (filter != NULL) {
        filter->Run(candidates);
      }
    }
  }
}

void CdnHookRegistry::DoAction(const StringPiece& hook, Writer* writer,
                               MessageHandler* handler) const {
  const RegistrationVector* registrations = Find(hook);
  if (registrations != NULL) {
    for (int i = 0, n = registrations->size(); i < n; ++i) {
      ActionCallback* action = (*registrations)[i]->action;
      if (action != NULL) {
        action->Run(writer, handler);
      }
    }
  }
}

int CdnHookRegistry::NumHandlers(const StringPiece& hook) const {
  const RegistrationVector* registrations = Find(hook);
  return (registrations == NULL) ? 0 : registrations->size();
}

int CdnHookRegistry::FirstPriority(const StringPiece& hook) const {
  const RegistrationVector* registrations = Find(hook);
  if (registrations == NULL || registrations->empty()) {
    return -1;
  }
  return registrations->front()->priority;
}

}  // namespace net_cdnmirror
