// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_H
#define PLPDESIGN_H

#include <plpdesign/version.hpp>
#include <plpdesign/Util.hpp>
#include <plpdesign/Errors.hpp>
#include <plpdesign/Bases.hpp>
#include <plpdesign/Types.hpp>
#include <plpdesign/Table.hpp>
#include <plpdesign/MatchTable.hpp>
#include <plpdesign/Transcriptome.hpp>
#include <plpdesign/BarcodeAssigner.hpp>

#endif //PLPDESIGN_H
