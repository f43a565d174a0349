#ifndef GROUND_LEVEL_ORDERING_ORDERCOMPARATORCONFIG_HPP
#define GROUND_LEVEL_ORDERING_ORDERCOMPARATORCONFIG_HPP
//****************************************************************************************************************************************************
//* Zero-Clause BSD (0BSD)
//*
//* Copyright (c) 2025, Mana Battery
//*
//* Permission to use, copy, modify, and/or distribute this software for any purpose with or without fee is hereby granted.
//*
//* THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
//* MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
//* WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
//* OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
//****************************************************************************************************************************************************

#include <GroundLevel/Metadata/AnnotationKind.hpp>
#include <string>

namespace GroundLevel
{
  /// @brief Configuration for OrderComparator.
  ///
  /// The defaults match the well-known ordering annotation. Override them when the metadata source uses
  /// different names for the same concept.
  struct OrderComparatorConfig
  {
    /// @brief Name of the annotation kind carrying the ordering priority.
    std::string OrderAnnotationKind{AnnotationKinds::OrderName};

    /// @brief Name of the attribute holding the priority. Must hold an int32_t.
    std::string ValueAttribute{AnnotationKinds::ValueAttribute};
  };
}

#endif
