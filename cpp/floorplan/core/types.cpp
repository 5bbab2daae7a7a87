#include "floorplan/core/types.h"

namespace floorplan {

const char* editErrorMessage(EditError err) {
    switch (err) {
        case EditError::Ok: return "OK";
        case EditError::WallNotFound: return "The selected wall no longer exists.";
        case EditError::RoomNotFound: return "The selected room no longer exists.";
        case EditError::StoreyNotFound: return "The selected storey no longer exists.";
        case EditError::DoorNotFound: return "The selected door no longer exists.";
        case EditError::DegenerateWall: return "A wall must have a non-zero length.";
        case EditError::IncompatibleAttributes: return "Walls must have the same type, height, and thickness.";
        case EditError::NotCollinear: return "Walls must lie on the same line to be merged.";
        case EditError::NotConnected: return "Walls must be connected at one endpoint.";
        case EditError::PointOffSegment: return "The split point is not on the wall.";
        case EditError::PointNearEndpoint: return "The split point is too close to the end of the wall.";
        case EditError::WallTooShort: return "The wall is too short to be split.";
        case EditError::InvalidSelection: return "Invalid wall selection.";
        case EditError::TooFewVertices: return "At least 3 points are required to define a room.";
        case EditError::UnmatchedEdge: return "Every room edge must follow an existing wall.";
        case EditError::InsideGhostArea: return "A room cannot be placed inside a double-height space.";
        case EditError::InvalidDimensions: return "Wall height and thickness must be greater than 0.";
        case EditError::InvalidDoorPosition: return "A door must be placed on an existing wall.";
        case EditError::PersistenceUnavailable: return "Connection problem. Please try again.";
        case EditError::PersistenceRejected: return "The change was rejected by the server.";
        case EditError::EditInProgress: return "Please wait for the previous change to finish.";
        case EditError::NothingToUndo: return "Nothing to undo.";
        case EditError::NothingToRedo: return "Nothing to redo.";
        case EditError::ConsistencyViolation: return "Internal consistency error.";
    }
    return "Unknown error.";
}

bool isValidationError(EditError err) {
    switch (err) {
        case EditError::DegenerateWall:
        case EditError::IncompatibleAttributes:
        case EditError::NotCollinear:
        case EditError::NotConnected:
        case EditError::PointOffSegment:
        case EditError::PointNearEndpoint:
        case EditError::WallTooShort:
        case EditError::InvalidSelection:
        case EditError::TooFewVertices:
        case EditError::UnmatchedEdge:
        case EditError::InsideGhostArea:
        case EditError::InvalidDimensions:
        case EditError::InvalidDoorPosition:
        case EditError::WallNotFound:
        case EditError::RoomNotFound:
        case EditError::StoreyNotFound:
        case EditError::DoorNotFound:
            return true;
        default:
            return false;
    }
}

bool isConnectivityError(EditError err) {
    return err == EditError::PersistenceUnavailable || err == EditError::PersistenceRejected;
}

} // namespace floorplan
