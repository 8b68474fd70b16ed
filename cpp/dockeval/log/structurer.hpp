#pragma once
/*
================================================================================
Fragment 2.4 - Log: Structurer (Frame Remap + Derived Columns)
FILE: cpp/dockeval/log/structurer.hpp

Purpose:
  Convert a parsed session into the FlightSeries every downstream stage reads.

Steps (in order):
  1) Rename "Rot. Rate.Z [deg/s]" -> "Rot. Rate.z [deg/s]" (logger naming bug).
  2) Logger frame -> station frame: swap THC.x<->THC.z and RHC.x<->RHC.z
     labels, then negate the new THC.x and THC.z.
  3) Append derived columns:
       Lateral Offset, Lateral Velocity, Ideal Approach Vel, Angle to Port,
       Approach Cone, Max Rot Angle, Max Rot Velocity.
================================================================================
*/

#include <array>

#include "dockeval/core/settings.hpp"
#include "dockeval/log/flight_series.hpp"
#include "dockeval/log/log_parser.hpp"

namespace dockeval {

// Raw and derived column names used across the engine.
namespace col {
inline constexpr const char* kThcX = "THC.x";
inline constexpr const char* kThcY = "THC.y";
inline constexpr const char* kThcZ = "THC.z";
inline constexpr const char* kRhcX = "RHC.x";
inline constexpr const char* kRhcY = "RHC.y";
inline constexpr const char* kRhcZ = "RHC.z";
inline constexpr const char* kCogPosX = "COG Pos.x [m]";
inline constexpr const char* kCogPosY = "COG Pos.y [m]";
inline constexpr const char* kCogPosZ = "COG Pos.z [m]";
inline constexpr const char* kCogVelX = "COG Vel.x [m]";
inline constexpr const char* kCogVelY = "COG Vel.y [m]";
inline constexpr const char* kCogVelZ = "COG Vel.z [m]";
inline constexpr const char* kPortPosX = "Port Pos.x [m]";
inline constexpr const char* kPortPosY = "Port Pos.y [m]";
inline constexpr const char* kPortPosZ = "Port Pos.z [m]";
inline constexpr const char* kRotAngleX = "Rot Angle.x [deg]";
inline constexpr const char* kRotAngleY = "Rot Angle.y [deg]";
inline constexpr const char* kRotAngleZ = "Rot Angle.z [deg]";
inline constexpr const char* kRotRateX = "Rot. Rate.x [deg/s]";
inline constexpr const char* kRotRateY = "Rot. Rate.y [deg/s]";
inline constexpr const char* kRotRateZ = "Rot. Rate.z [deg/s]";
inline constexpr const char* kTankMass = "Tank mass [kg]";

inline constexpr const char* kLateralOffset = "Lateral Offset";
inline constexpr const char* kLateralVelocity = "Lateral Velocity";
inline constexpr const char* kIdealApproachVel = "Ideal Approach Vel";
inline constexpr const char* kAngleToPort = "Angle to Port";
inline constexpr const char* kApproachCone = "Approach Cone";
inline constexpr const char* kMaxRotAngle = "Max Rot Angle";
inline constexpr const char* kMaxRotVelocity = "Max Rot Velocity";

inline constexpr std::array<const char*, 3> kThcAxes{kThcX, kThcY, kThcZ};
inline constexpr std::array<const char*, 3> kRhcAxes{kRhcX, kRhcY, kRhcZ};
} // namespace col

// Angle (deg) between (front - back) and -front. NaN if either has zero length.
double angle_to_port_deg(const std::array<double, 3>& front, const std::array<double, 3>& back);

// Builds the structured series. Throws ValidationError when a required raw
// column is missing or SimTime is not strictly increasing.
FlightSeries structure_session(const ParsedSession& parsed,
                               const StructureSettings& settings = StructureSettings{});

} // namespace dockeval
