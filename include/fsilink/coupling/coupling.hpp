#pragma once

// Coupling framework components
#include <fsilink/coupling/transport.hpp>
#include <fsilink/coupling/mpi_transport.hpp>
#include <fsilink/coupling/field_mapper.hpp>
#include <fsilink/coupling/peer_discovery.hpp>
#include <fsilink/coupling/protocol.hpp>
#include <fsilink/coupling/run_control.hpp>
#include <fsilink/coupling/coupling_config.hpp>
#include <fsilink/coupling/coupling_session.hpp>
#include <fsilink/coupling/timestep_negotiator.hpp>
#include <fsilink/coupling/predictor.hpp>
#include <fsilink/coupling/convergence.hpp>
#include <fsilink/coupling/session_controller.hpp>

/**
 * @file coupling.hpp
 * @brief Main coupling framework header
 *
 * This header includes all coupling-related components:
 * - TransportChannel / MpiTransport: named-value exchange with the peer
 * - FieldMapper: interface ordering and scatter to the parent mesh
 * - PeerDiscovery: locating the structural solver
 * - CouplingSession: interface buffers and iteration state
 * - SessionController: time-step and sub-iteration sequencing
 */
