#ifndef FLOORPLAN_CORE_TYPES_H
#define FLOORPLAN_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

// Records shared by every layer of the floor plan engine.
// All lengths are project units (millimetres). Ids are owned by the persistence service.

namespace floorplan {

static constexpr std::uint32_t kInvalidId = 0;

// Ids at or above this value are placeholders inside a WallDiff for walls the same
// diff creates; they never reach the persistence service.
static constexpr std::uint32_t kProvisionalIdBase = 0x80000000u;

inline bool isProvisionalId(std::uint32_t id) { return id >= kProvisionalIdBase; }

struct Point2d {
    double x;
    double y;
};

inline Point2d operator+(const Point2d& a, const Point2d& b) { return Point2d{a.x + b.x, a.y + b.y}; }
inline Point2d operator-(const Point2d& a, const Point2d& b) { return Point2d{a.x - b.x, a.y - b.y}; }
inline Point2d operator*(const Point2d& a, double s) { return Point2d{a.x * s, a.y * s}; }

struct Segment {
    Point2d a;
    Point2d b;
};

enum class WallType : std::uint8_t {
    Wall = 0,
    Partition = 1,
};

struct WallRec {
    std::uint32_t id;
    std::uint32_t storeyId;
    Point2d start;
    Point2d end;
    double thickness;
    double height;
    WallType type;
    // Material attributes (do not take part in merge compatibility)
    bool hasConcreteBase;
    double concreteBaseHeight;
};

enum class JointMethod : std::uint8_t {
    ButtIn = 0,
    Cut45 = 1,
};

// Rendering-only record of how two walls meet; never used for topology.
struct JointRec {
    std::uint32_t wallA;
    std::uint32_t wallB;
    Point2d point;
    JointMethod method;
};

enum class FloorType : std::uint8_t {
    None = 0,
    Slab = 1,
    Panel = 2,
};

struct RoomRec {
    std::uint32_t id;
    std::uint32_t storeyId;
    std::string name;
    std::vector<Point2d> polygon;      // closed implicitly, last vertex connects to first
    std::vector<std::uint32_t> wallIds;
    FloorType floorType;
    double floorThickness;
    double height;
    double baseElevation;              // absolute, same unit as storey elevation
    bool hasLabelAnchor;
    Point2d labelAnchor;
    double temperature;
    std::string remarks;
};

struct StoreyRec {
    std::uint32_t id;
    std::uint32_t projectId;
    std::string name;
    double elevation;
    std::int32_t order;
    double defaultRoomHeight;
    double slabThickness;
};

enum class DoorType : std::uint8_t { Swing = 0, Slide = 1 };
enum class DoorConfiguration : std::uint8_t { Single = 0, Double = 1 };
enum class DoorSide : std::uint8_t { Interior = 0, Exterior = 1 };
enum class DoorDirection : std::uint8_t { Left = 0, Right = 1 };

struct DoorRec {
    std::uint32_t id;
    std::uint32_t wallId;
    double width;
    double height;
    double thickness;
    double position;                   // parametric, 0 = wall start, 1 = wall end
    DoorType type;
    DoorConfiguration configuration;
    DoorSide side;
    DoorDirection direction;
};

// View-only projection of a room footprint from a lower storey.
struct GhostArea {
    std::uint32_t roomId;
    std::uint32_t storeyId;
    std::vector<Point2d> polygon;
    double baseElevation;
    double topElevation;
};

// Errors surfaced by planners and the edit session.
enum class EditError : std::uint32_t {
    Ok = 0,
    WallNotFound = 1,
    RoomNotFound = 2,
    StoreyNotFound = 3,
    DoorNotFound = 4,
    DegenerateWall = 5,
    IncompatibleAttributes = 6,
    NotCollinear = 7,
    NotConnected = 8,
    PointOffSegment = 9,
    PointNearEndpoint = 10,
    WallTooShort = 11,
    InvalidSelection = 12,
    TooFewVertices = 13,
    UnmatchedEdge = 14,
    InsideGhostArea = 15,
    InvalidDimensions = 16,
    InvalidDoorPosition = 17,
    PersistenceUnavailable = 18,
    PersistenceRejected = 19,
    EditInProgress = 20,
    NothingToUndo = 21,
    NothingToRedo = 22,
    ConsistencyViolation = 23,
};

const char* editErrorMessage(EditError err);

// Validation failures leave the network untouched; connectivity failures may leave partial diffs applied.
bool isValidationError(EditError err);
bool isConnectivityError(EditError err);

} // namespace floorplan

#endif // FLOORPLAN_CORE_TYPES_H
