// map_writer: converts a road graph in .gl text form into a binary map file
// (format version 3) the viewer can open, and prints the header of map files.
//
// .gl layout:
//   <node count> <edge count>
//   <lat> <lon>            one line per node, degrees
//   <u> <v> <w> <c>        one line per edge; w is the road width class 0..5
//
// Roads with w >= 3 also go into the low zoom sub-file (zoom 0..11).

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "mapstream/Geo.hpp"
#include "mapstream/Log.hpp"
#include "mapstream/MapDatabase.hpp"
#include "mapstream/MapFileWriter.hpp"

using namespace mapstream;

struct Edge {
    int u;
    int v;
    int w;
    int c;
};

static const char* highwayForWidth(int w){
    switch(w){
        case 5:  return "motorway";
        case 4:  return "primary";
        case 3:  return "secondary";
        case 2:  return "tertiary";
        case 1:  return "residential";
        default: return "service";
    }
}

static const uint8_t kLowBaseZoom = 9;
static const uint8_t kHighBaseZoom = 14;
// bounding box padding, microdegrees
static const int32_t kPadding = 1000;

static int printInfo(const std::string& path){
    MapDatabase db;
    FileOpenResult r = db.openFile(path);
    if(!r.isSuccess()){
        std::cerr << "Cannot open " << path << ": " << r.toString() << "\n";
        return 1;
    }
    std::shared_ptr<const MapFileInfo> info = db.getMapFileInfo();
    std::cout << "file:        " << path << "\n";
    std::cout << "version:     " << info->fileVersion << "\n";
    std::cout << "size:        " << info->fileSize << "\n";
    std::cout << "date:        " << info->mapDate << "\n";
    std::cout << "bbox:        " << info->boundingBox.toString() << "\n";
    std::cout << "tile size:   " << info->tilePixelSize << "\n";
    std::cout << "projection:  " << info->projectionName << "\n";
    std::cout << "debug:       " << (info->debugFile ? "yes" : "no") << "\n";
    if(info->languagePreference) std::cout << "language:    " << *info->languagePreference << "\n";
    if(info->startPosition){
        std::cout << "start:       " << info->startPosition->latitude() << ", " << info->startPosition->longitude() << "\n";
    }
    if(info->commentText) std::cout << "comment:     " << *info->commentText << "\n";
    std::cout << "poi tags:    " << info->poiTags.size() << "\n";
    std::cout << "way tags:    " << info->wayTags.size() << "\n";
    for(const auto& sp : db.getMapFileHeader().getSubFileParameters()){
        std::cout << "sub-file:    base " << (int)sp.baseZoomLevel
                  << " zoom " << (int)sp.zoomLevelMin << ".." << (int)sp.zoomLevelMax
                  << " blocks " << sp.blocksWidth << "x" << sp.blocksHeight
                  << " size " << sp.subFileSize << "\n";
    }
    return 0;
}

static void addEdge(MapFileWriter& writer, size_t subFile, uint8_t baseZoom, int zoomLevel,
                    const Way& way, const GeoPoint& a, const GeoPoint& b){
    using namespace MercatorProjection;
    const int64_t x0 = longitudeToTileX(a.longitude(), baseZoom);
    const int64_t x1 = longitudeToTileX(b.longitude(), baseZoom);
    const int64_t y0 = latitudeToTileY(a.latitude(), baseZoom);
    const int64_t y1 = latitudeToTileY(b.latitude(), baseZoom);
    // every block the segment's box touches gets a copy
    for(int64_t ty = std::min(y0, y1); ty <= std::max(y0, y1); ++ty){
        for(int64_t tx = std::min(x0, x1); tx <= std::max(x0, x1); ++tx){
            writer.addWay(subFile, tx, ty, zoomLevel, way);
        }
    }
}

static void usageText(const char* argv0){
    std::cerr << "Usage: " << argv0 << " <input.gl> <output.map> [--debug] [--comment TEXT]\n"
              << "       " << argv0 << " --info <file.map>\n";
}

int main(int argc, char** argv)
{
    if(argc == 3 && std::string(argv[1]) == "--info") return printInfo(argv[2]);
    if(argc < 3){
        usageText(argv[0]);
        return 1;
    }

    const std::string inputPath  = argv[1];
    const std::string outputPath = argv[2];

    MapFileWriter writer;
    for(int i=3; i<argc; ++i){
        const std::string arg = argv[i];
        if(arg == "--debug") writer.debugFile = true;
        else if(arg == "--comment" && i+1 < argc) writer.commentText = std::string(argv[++i]);
        else {
            usageText(argv[0]);
            return 1;
        }
    }

    std::ifstream in(inputPath);
    if(!in){
        logError("Writer", "Failed to open input file " + inputPath);
        return 1;
    }

    size_t numNodes = 0;
    size_t numEdges = 0;
    if(!(in >> numNodes >> numEdges)){
        logError("Writer", "Failed to read node and edge counts.");
        return 1;
    }

    std::vector<GeoPoint> nodes;
    nodes.reserve(numNodes);
    BoundingBox bbox;
    bbox.minLatitudeE6 = std::numeric_limits<int32_t>::max();
    bbox.minLongitudeE6 = std::numeric_limits<int32_t>::max();
    bbox.maxLatitudeE6 = std::numeric_limits<int32_t>::min();
    bbox.maxLongitudeE6 = std::numeric_limits<int32_t>::min();

    for(size_t i=0; i<numNodes; ++i){
        double lat = 0.0, lon = 0.0;
        if(!(in >> lat >> lon)){
            logError("Writer", str("Error reading node ", i, " (lat lon)."));
            return 1;
        }
        const GeoPoint p = GeoPoint::fromDegrees(MercatorProjection::limitLatitude(lat),
                                                 MercatorProjection::limitLongitude(lon));
        nodes.push_back(p);
        bbox.minLatitudeE6 = std::min(bbox.minLatitudeE6, p.latitudeE6);
        bbox.minLongitudeE6 = std::min(bbox.minLongitudeE6, p.longitudeE6);
        bbox.maxLatitudeE6 = std::max(bbox.maxLatitudeE6, p.latitudeE6);
        bbox.maxLongitudeE6 = std::max(bbox.maxLongitudeE6, p.longitudeE6);
    }
    if(nodes.empty()){
        logError("Writer", "Input has no nodes.");
        return 1;
    }

    bbox.minLatitudeE6 = std::max(bbox.minLatitudeE6 - kPadding, (int32_t)(MercatorProjection::LATITUDE_MIN * kConversionFactor));
    bbox.maxLatitudeE6 = std::min(bbox.maxLatitudeE6 + kPadding, (int32_t)(MercatorProjection::LATITUDE_MAX * kConversionFactor));
    bbox.minLongitudeE6 = std::max(bbox.minLongitudeE6 - kPadding, -180000000);
    bbox.maxLongitudeE6 = std::min(bbox.maxLongitudeE6 + kPadding, 180000000);
    writer.boundingBox = bbox;
    writer.startPosition = bbox.getCenterPoint();

    const size_t low = writer.addSubFile(kLowBaseZoom, 0, 11);
    const size_t high = writer.addSubFile(kHighBaseZoom, 12, 21);

    size_t written = 0;
    for(size_t i=0; i<numEdges; ++i){
        Edge e{};
        if(!(in >> e.u >> e.v >> e.w >> e.c)){
            logWarn("Writer", str("stopping at edge ", i, ", malformed line or EOF."));
            break;
        }
        if(e.u < 0 || e.v < 0 || (size_t)e.u >= numNodes || (size_t)e.v >= numNodes){
            logWarn("Writer", str("edge (", e.u, ",", e.v, ") references invalid node index. Skipped."));
            continue;
        }

        Way way;
        way.tags.push_back(Tag("highway", highwayForWidth(e.w)));
        way.coordinateBlocks.push_back({nodes[e.u], nodes[e.v]});

        const GeoPoint& a = nodes[e.u];
        const GeoPoint& b = nodes[e.v];
        if(e.w >= 3) addEdge(writer, low, kLowBaseZoom, e.w >= 5 ? 0 : 8, way, a, b);
        addEdge(writer, high, kHighBaseZoom, e.w >= 2 ? 12 : 14, way, a, b);
        ++written;
    }

    logInfo("Writer", str("Loaded from GL: ", numNodes, " nodes, ", written, " edges (valid)."));

    std::string error;
    if(!writer.write(outputPath, error)){
        logError("Writer", error);
        return 1;
    }
    logInfo("Writer", "Wrote map file: " + outputPath + " bbox " + bbox.toString());
    return 0;
}
