#pragma once

// ZPR - shared protocol definitions
// Identifiers (addresses, distinguished names), packet metadata, RPC command codes,
// and the WriteTo contract that turns them into canonical bytes.

// Core types and utilities
#include <zpr/common.hpp>
#include <zpr/error.hpp>
#include <zpr/version.hpp>
#include <zpr/write_to.hpp>

// Identifiers
#include <zpr/address.hpp>
#include <zpr/dn.hpp>
#include <zpr/well_known.hpp>

// Packet metadata
#include <zpr/frame.hpp>
#include <zpr/packet_info.hpp>
#include <zpr/rpc_commands.hpp>

// All types are in the zpr:: namespace
// Available types:
//   - zpr::Bytes (dp::Vector<dp::u8>)
//   - zpr::Error, zpr::ErrorKind, zpr::Res<T>
//   - zpr::Sink (base class), BufferSink, FdSink, CountingSink, Reader
//   - zpr::Address, AddressKind, L3Type
//   - zpr::DistinguishedName (zpr::DN), Rdn
//   - zpr::RpcCommand, Command, Tcst
//   - zpr::PacketInfo, PacketEndpoint, PacketAux, Frame
