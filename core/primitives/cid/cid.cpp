/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/cid/cid.hpp"

#include <algorithm>

#include <libp2p/multi/content_identifier_codec.hpp>
#include <libp2p/multi/uvarint.hpp>

using libp2p::multi::ContentIdentifierCodec;
using libp2p::multi::Multihash;
using libp2p::multi::UVarint;

namespace fcp {

  CID::CID() : ContentIdentifier({}, {}, Multihash::create({}, {}).value()) {}

  CID::CID(const ContentIdentifier &cid) : ContentIdentifier(cid) {}

  CID::CID(ContentIdentifier &&cid) noexcept
      : ContentIdentifier(
          cid.version, cid.content_type, std::move(cid.content_address)) {}

  CID::CID(Version version, Multicodec content_type, Multihash content_address)
      : ContentIdentifier(version, content_type, std::move(content_address)) {}

  CID::CID(CID &&cid) noexcept
      : ContentIdentifier(
          cid.version, cid.content_type, std::move(cid.content_address)) {}

  CID &CID::operator=(CID &&cid) noexcept {
    version = cid.version;
    content_type = cid.content_type;
    content_address = std::move(cid.content_address);
    return *this;
  }

  outcome::result<std::string> CID::toString() const {
    return ContentIdentifierCodec::toString(*this);
  }

  outcome::result<Bytes> CID::toBytes() const {
    return ContentIdentifierCodec::encode(*this);
  }

  Bytes CID::rawBytes() const {
    Bytes bytes;
    if (version == Version::V1) {
      append(bytes, UVarint{static_cast<uint64_t>(version)}.toBytes());
      append(bytes, UVarint{static_cast<uint64_t>(content_type)}.toBytes());
    }
    append(bytes, content_address.toBuffer());
    return bytes;
  }

  outcome::result<CID> CID::fromString(const std::string &str) {
    OUTCOME_TRY(cid, ContentIdentifierCodec::fromString(str));
    return CID{std::move(cid)};
  }

  outcome::result<CID> CID::fromBytes(BytesIn input) {
    OUTCOME_TRY(cid, ContentIdentifierCodec::decode(input));
    return CID{std::move(cid)};
  }

  bool CidBytesLess::operator()(const CID &lhs, const CID &rhs) const {
    const auto l{lhs.rawBytes()};
    const auto r{rhs.rawBytes()};
    return std::lexicographical_compare(l.begin(), l.end(), r.begin(), r.end());
  }
}  // namespace fcp
