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

#include <GroundLevel/Metadata/AnnotationSet.hpp>
#include <utility>

namespace GroundLevel
{
  AnnotationSet& AnnotationSet::Add(const AnnotationKind& kind, AttributeMap attributes)
  {
    m_annotations.insert_or_assign(kind.GetName(), std::move(attributes));
    return *this;
  }

  bool AnnotationSet::IsAnnotated(const AnnotationKind& kind) const
  {
    return m_annotations.find(kind.GetName()) != m_annotations.end();
  }

  std::optional<AttributeMap> AnnotationSet::TryGetAttributes(const AnnotationKind& kind) const
  {
    const auto itrFind = m_annotations.find(kind.GetName());
    if (itrFind == m_annotations.end())
    {
      return std::nullopt;
    }
    return itrFind->second;
  }
}
