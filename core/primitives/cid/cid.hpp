/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/multi/content_identifier.hpp>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace fcp {
  class CID : public libp2p::multi::ContentIdentifier {
   public:
    using ContentIdentifier::ContentIdentifier;

    using Multicodec = libp2p::multi::MulticodecType::Code;

    /**
     * ContentIdentifier is not default-constructable, but in some cases we need
     * default value. This value can be used to initialize class member or local
     * variable.
     */
    CID();

    explicit CID(const ContentIdentifier &cid);

    explicit CID(ContentIdentifier &&cid) noexcept;

    CID(CID &&cid) noexcept;

    CID(const CID &cid) = default;

    CID(Version version,
        Multicodec content_type,
        libp2p::multi::Multihash content_address);

    ~CID() = default;

    CID &operator=(const CID &) = default;

    CID &operator=(CID &&cid) noexcept;

    /**
     * @brief string-encodes cid
     * @return encoded value or error
     */
    outcome::result<std::string> toString() const;

    /**
     * @brief encodes CID to bytes
     * @return byte-representation of CID
     */
    outcome::result<Bytes> toBytes() const;

    /**
     * @brief binary form of CID (version, codec, multihash), without the
     * validity checks of the codec, so it is defined for any CID value
     */
    Bytes rawBytes() const;

    static outcome::result<CID> fromString(const std::string &str);

    static outcome::result<CID> fromBytes(BytesIn input);
  };

  /// Orders CIDs by their binary form
  struct CidBytesLess {
    bool operator()(const CID &lhs, const CID &rhs) const;
  };
}  // namespace fcp
