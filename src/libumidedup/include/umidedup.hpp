// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_H
#define UMIDEDUP_H

#include <umidedup/version.hpp>
#include <umidedup/Util.hpp>
#include <umidedup/Errors.hpp>
#include <umidedup/Sam.hpp>
#include <umidedup/Annotation.hpp>
#include <umidedup/Location.hpp>
#include <umidedup/Kit.hpp>
#include <umidedup/Store.hpp>
#include <umidedup/MemoryStore.hpp>
#include <umidedup/SqliteStore.hpp>

#endif //UMIDEDUP_H
