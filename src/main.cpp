// main.cpp
// Map viewer for mapsforge binary map files (.map, format version 3).
//
// Controls:
// - Left mouse drag: pan
// - Mouse wheel / +/-: zoom in and out by one level
// - Drop a .map file on the window: switch map file
// - F: tile frames, C: tile coordinates, W: highlight water tiles
//
// Tiles are rendered on a background worker (see mapstream::TileWorker) and
// cached in memory and in ~/.cache/mapstream/<session>/. The viewer only
// uploads finished tile bitmaps as textures and draws them.
//
// Text rendering:
// - Bitmap atlas via stb_truetype (ASCII 32..126).
// - Used for the status line and the optional z/x/y tile labels.

#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cmath>
#include <cstring>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"

#include "mapstream/Config.hpp"
#include "mapstream/Hash.hpp"
#include "mapstream/Log.hpp"
#include "mapstream/MapSession.hpp"

using namespace mapstream;

// ----------------- Viewer state -----------------

static MapSession* gSession = nullptr;
static int gFbW=1280, gFbH=720;
static bool gMouseLeft=false;
static double gLastX=0, gLastY=0;
// set from the worker thread when a tile finished
static std::atomic<bool> gDirty{true};

// ----------------- GL utils -----------------

static GLuint compileShader(GLenum type, const char* src){
    GLuint s = glCreateShader(type);
    glShaderSource(s, 1, &src, nullptr);
    glCompileShader(s);
    GLint ok=0; glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
    if(!ok){
        GLint len=0; glGetShaderiv(s, GL_INFO_LOG_LENGTH, &len);
        std::string log(len,'\0'); glGetShaderInfoLog(s,len,nullptr,log.data());
        logError("GL", "Shader compile error:\n" + log);
    }
    return s;
}
static GLuint linkProgram(GLuint vs, GLuint fs){
    GLuint p=glCreateProgram();
    glAttachShader(p,vs); glAttachShader(p,fs);
    glLinkProgram(p);
    GLint ok=0; glGetProgramiv(p, GL_LINK_STATUS, &ok);
    if(!ok){
        GLint len=0; glGetProgramiv(p, GL_INFO_LOG_LENGTH, &len);
        std::string log(len,'\0'); glGetProgramInfoLog(p,len,nullptr,log.data());
        logError("GL", "Program link error:\n" + log);
    }
    glDeleteShader(vs); glDeleteShader(fs);
    return p;
}

// Screen space: uView = (left,right,bottom,top) = (0,fbW,fbH,0), y down.
static GLuint createTileProgram(){
    const char* vsrc = R"GLSL(
        #version 330 core
        layout(location=0) in vec2 aPos;
        layout(location=1) in vec2 aUV;
        out vec2 vUV;
        uniform vec4 uView; // left,right,bottom,top
        void main(){
            float x = (aPos.x - uView.x) / (uView.y - uView.x) * 2.0 - 1.0;
            float y = (aPos.y - uView.z) / (uView.w - uView.z) * 2.0 - 1.0;
            gl_Position = vec4(x,y,0,1);
            vUV = aUV;
        }
    )GLSL";
    const char* fsrc = R"GLSL(
        #version 330 core
        in vec2 vUV;
        out vec4 FragColor;
        uniform sampler2D uTex;
        void main(){ FragColor = texture(uTex, vUV); }
    )GLSL";
    return linkProgram(compileShader(GL_VERTEX_SHADER, vsrc),
                       compileShader(GL_FRAGMENT_SHADER, fsrc));
}

static GLuint createTextProgram(){
    const char* vsrc = R"GLSL(
        #version 330 core
        layout(location=0) in vec2 aPos;
        layout(location=1) in vec2 aUV;
        layout(location=2) in vec4 aColor;
        out vec2 vUV;
        out vec4 vColor;
        uniform vec4 uView; // left,right,bottom,top
        void main(){
            float x = (aPos.x - uView.x) / (uView.y - uView.x) * 2.0 - 1.0;
            float y = (aPos.y - uView.z) / (uView.w - uView.z) * 2.0 - 1.0;
            gl_Position = vec4(x,y,0,1);
            vUV = aUV;
            vColor = aColor;
        }
    )GLSL";
    const char* fsrc = R"GLSL(
        #version 330 core
        in vec2 vUV;
        in vec4 vColor;
        out vec4 FragColor;
        uniform sampler2D uTex;
        void main(){
            float a = texture(uTex, vUV).r;
            FragColor = vec4(vColor.rgb, vColor.a * a);
        }
    )GLSL";
    return linkProgram(compileShader(GL_VERTEX_SHADER, vsrc),
                       compileShader(GL_FRAGMENT_SHADER, fsrc));
}

// ----------------- Font atlas -----------------

static GLuint gTextAtlasTex = 0;
static bool gTextReady = false;
static int gAtlasW = 512;
static int gAtlasH = 512;
static float gFontPixelSize = 18.0f;
static stbtt_bakedchar gBaked[96];

static bool readFileBytes(const std::string& path, std::vector<uint8_t>& out){
    std::ifstream in(path, std::ios::binary);
    if(!in) return false;
    in.seekg(0,std::ios::end);
    size_t n = (size_t)in.tellg();
    in.seekg(0,std::ios::beg);
    out.resize(n);
    in.read((char*)out.data(), (std::streamsize)n);
    return true;
}

static std::string findDefaultFontPath(){
    const std::vector<std::string> candidates = {
        "data/DejaVuSans.ttf",
        "/run/current-system/sw/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    };
    for(const auto& p: candidates){
        std::ifstream f(p, std::ios::binary);
        if(f.good()) return p;
    }
    return "";
}

static bool initFontAtlas(const std::string& fontPath){
    std::vector<uint8_t> ttf;
    if(!readFileBytes(fontPath, ttf)){
        logError("Font", "Failed to read font: " + fontPath);
        return false;
    }
    std::vector<uint8_t> bitmap((size_t)gAtlasW * (size_t)gAtlasH, 0);
    int res = stbtt_BakeFontBitmap(ttf.data(), 0, gFontPixelSize,
                                   bitmap.data(), gAtlasW, gAtlasH, 32, 96, gBaked);
    if(res <= 0){
        logError("Font", "stbtt_BakeFontBitmap failed. Try a different TTF or a larger atlas.");
        return false;
    }

    glGenTextures(1, &gTextAtlasTex);
    glBindTexture(GL_TEXTURE_2D, gTextAtlasTex);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_R8, gAtlasW, gAtlasH, 0, GL_RED, GL_UNSIGNED_BYTE, bitmap.data());
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glBindTexture(GL_TEXTURE_2D, 0);

    gTextReady = true;
    logInfo("Font", "Font loaded: " + fontPath);
    return true;
}

struct TextVertex {
    float x,y;
    float u,v;
    float r,g,b,a;
};

// Baseline-anchored text at screen pixel (x,y).
static void appendText(std::vector<TextVertex>& verts, const std::string& text, float x, float y,
                       float r, float g, float b, float a){
    auto emit = [&](float px, float py, float u, float v){
        verts.push_back(TextVertex{px, py, u, v, r, g, b, a});
    };
    for(unsigned char uc : text){
        if(uc < 32 || uc > 126) continue;
        stbtt_aligned_quad q;
        stbtt_GetBakedQuad(gBaked, gAtlasW, gAtlasH, uc-32, &x, &y, &q, 1);

        // 2 triangles
        emit(q.x0, q.y0, q.s0, q.t0);
        emit(q.x1, q.y0, q.s1, q.t0);
        emit(q.x1, q.y1, q.s1, q.t1);

        emit(q.x0, q.y0, q.s0, q.t0);
        emit(q.x1, q.y1, q.s1, q.t1);
        emit(q.x0, q.y1, q.s0, q.t1);
    }
}

// ----------------- Tile textures -----------------

// GPU copies of tile bitmaps, keyed by z/x/y. A texture is re-uploaded when
// the cache hands out a different bitmap for the same tile.
struct TileTextures {
    struct Entry {
        GLuint tex = 0;
        TileBitmapPtr source;
        uint64_t lastUsed = 0;
    };
    std::unordered_map<uint64_t, Entry> entries;
    uint64_t frameId = 0;
    size_t maxResident = 256;

    static uint64_t keyOf(const Tile& t){
        const int64_t v[3] = { t.tileX, t.tileY, (int64_t)t.zoomLevel };
        return fnv1a64(v, sizeof(v));
    }

    GLuint get(const Tile& tile, const TileBitmapPtr& bitmap){
        Entry& e = entries[keyOf(tile)];
        e.lastUsed = frameId;
        if(e.source == bitmap) return e.tex;

        if(!e.tex) glGenTextures(1, &e.tex);
        glBindTexture(GL_TEXTURE_2D, e.tex);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, bitmap->getWidth(), bitmap->getHeight(), 0,
                     GL_RGBA, GL_UNSIGNED_BYTE, bitmap->data());
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
        glBindTexture(GL_TEXTURE_2D, 0);
        e.source = bitmap;
        return e.tex;
    }

    // Evict least recently drawn textures beyond maxResident.
    void evictIfNeeded(){
        if(entries.size() <= maxResident) return;
        std::vector<std::pair<uint64_t,uint64_t>> candidates; // (key,lastUsed)
        candidates.reserve(entries.size());
        for(const auto& kv : entries){
            if(kv.second.lastUsed == frameId) continue; // keep visible
            candidates.push_back({kv.first, kv.second.lastUsed});
        }
        std::sort(candidates.begin(), candidates.end(),
                  [](auto a, auto b){ return a.second < b.second; });

        size_t toEvict = entries.size() - maxResident;
        for(size_t i=0; i<candidates.size() && toEvict>0; i++){
            auto it = entries.find(candidates[i].first);
            if(it == entries.end()) continue;
            if(it->second.tex) glDeleteTextures(1, &it->second.tex);
            entries.erase(it);
            toEvict--;
        }
    }

    void clear(){
        for(auto& kv : entries) if(kv.second.tex) glDeleteTextures(1, &kv.second.tex);
        entries.clear();
    }
};

static TileTextures gTextures;

// ----------------- Input callbacks -----------------

static void framebufferSizeCallback(GLFWwindow* window, int w, int h){
    (void)window;
    gFbW = w;
    gFbH = h;
    glViewport(0,0,w,h);
    gDirty = true;
}

static void mouseButtonCallback(GLFWwindow* window, int button, int action, int mods){
    (void)mods;
    if(button == GLFW_MOUSE_BUTTON_LEFT){
        if(action == GLFW_PRESS){
            gMouseLeft = true;
            glfwGetCursorPos(window, &gLastX, &gLastY);
        } else if(action == GLFW_RELEASE){
            gMouseLeft = false;
        }
    }
}

static void cursorPosCallback(GLFWwindow* window, double x, double y){
    if(!gMouseLeft || !gSession) return;

    double dx = x - gLastX;
    double dy = y - gLastY;
    gLastX = x; gLastY = y;

    int winW=0, winH=0;
    glfwGetWindowSize(window, &winW, &winH);
    if(winW<=0 || winH<=0) return;

    // window pixels -> framebuffer pixels (HiDPI)
    gSession->moveMap(dx * (double)gFbW / (double)winW, dy * (double)gFbH / (double)winH);
    gDirty = true;
}

static void scrollCallback(GLFWwindow* window, double xoff, double yoff){
    (void)window; (void)xoff;
    if(yoff == 0.0 || !gSession) return;
    if(gSession->zoom(yoff > 0 ? 1 : -1)) gDirty = true;
}

static void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods){
    (void)window; (void)scancode; (void)mods;
    if(action != GLFW_PRESS || !gSession) return;

    DebugSettings debug = gSession->getDebugSettings();
    switch(key){
        case GLFW_KEY_EQUAL:
        case GLFW_KEY_KP_ADD:
            if(gSession->zoom(1)) gDirty = true;
            return;
        case GLFW_KEY_MINUS:
        case GLFW_KEY_KP_SUBTRACT:
            if(gSession->zoom(-1)) gDirty = true;
            return;
        case GLFW_KEY_F: debug.drawTileFrames = !debug.drawTileFrames; break;
        case GLFW_KEY_C: debug.drawTileCoordinates = !debug.drawTileCoordinates; break;
        case GLFW_KEY_W: debug.highlightWaterTiles = !debug.highlightWaterTiles; break;
        default: return;
    }
    gSession->setDebugSettings(debug);
    gDirty = true;
}

static void openMapFile(GLFWwindow* window, const std::string& path){
    FileOpenResult r = gSession->setMapFile(path);
    if(!r.isSuccess()){
        logError("Viewer", "Cannot open " + path + ": " + r.getErrorMessage());
        return;
    }
    gTextures.clear();
    glfwSetWindowTitle(window, ("map_viewer - " + path).c_str());
    gDirty = true;
}

static void dropCallback(GLFWwindow* window, int count, const char** paths){
    if(count <= 0 || !gSession) return;
    openMapFile(window, paths[0]);
}

// ----------------- Main -----------------

int main(int argc, char** argv){
    SessionConfig config = defaultSessionConfig();
    std::string argError;
    if(!parseArgs(argc, argv, config, argError)){
        std::cerr << argError << "\n" << usage(argv[0]);
        return 1;
    }
    setLogLevel(config.logLevel);

    std::string fontPath = config.fontPath.empty() ? findDefaultFontPath() : config.fontPath;

    if(!glfwInit()){
        logError("Viewer", "Failed to init GLFW");
        return 1;
    }
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    GLFWwindow* window = glfwCreateWindow(1280, 720, "map_viewer", nullptr, nullptr);
    if(!window){
        glfwTerminate();
        logError("Viewer", "Failed to create window");
        return 1;
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    if(!gladLoadGLLoader((GLADloadproc)glfwGetProcAddress)){
        logError("Viewer", "Failed to load GL");
        return 1;
    }

    glfwSetFramebufferSizeCallback(window, framebufferSizeCallback);
    glfwSetMouseButtonCallback(window, mouseButtonCallback);
    glfwSetCursorPosCallback(window, cursorPosCallback);
    glfwSetScrollCallback(window, scrollCallback);
    glfwSetKeyCallback(window, keyCallback);
    glfwSetDropCallback(window, dropCallback);

    int fbW=0, fbH=0;
    glfwGetFramebufferSize(window, &fbW, &fbH);
    framebufferSizeCallback(window, fbW, fbH);

    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    GLuint tileProg = createTileProgram();
    GLuint textProg = createTextProgram();

    if(!fontPath.empty()){
        if(!initFontAtlas(fontPath)){
            logWarn("Viewer", "Font init failed. Text rendering disabled.");
            gTextReady = false;
        }
    } else {
        logWarn("Viewer", "No font file found. Put a TTF at data/DejaVuSans.ttf or pass it as second argument. Text rendering disabled.");
        gTextReady = false;
    }

    // one dynamic quad for tiles, one dynamic buffer for text
    GLuint quadVao=0, quadVbo=0;
    glGenVertexArrays(1, &quadVao);
    glGenBuffers(1, &quadVbo);
    glBindVertexArray(quadVao);
    glBindBuffer(GL_ARRAY_BUFFER, quadVbo);
    glBufferData(GL_ARRAY_BUFFER, sizeof(float) * 24, nullptr, GL_DYNAMIC_DRAW);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, sizeof(float) * 4, (void*)0);
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, sizeof(float) * 4, (void*)(sizeof(float) * 2));

    GLuint textVao=0, textVbo=0;
    glGenVertexArrays(1, &textVao);
    glGenBuffers(1, &textVbo);
    glBindVertexArray(textVao);
    glBindBuffer(GL_ARRAY_BUFFER, textVbo);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, sizeof(TextVertex), (void*)offsetof(TextVertex, x));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, sizeof(TextVertex), (void*)offsetof(TextVertex, u));
    glEnableVertexAttribArray(2);
    glVertexAttribPointer(2, 4, GL_FLOAT, GL_FALSE, sizeof(TextVertex), (void*)offsetof(TextVertex, r));
    glBindVertexArray(0);

    MapSession session(config);
    gSession = &session;
    session.setRepaintCallback([](const TileJob&, const TileBitmapPtr&){
        gDirty = true;
        glfwPostEmptyEvent();
    });
    if(!config.mapFile.empty()) openMapFile(window, config.mapFile);
    else logInfo("Viewer", "No map file given; drop a .map file on the window.");

    std::vector<VisibleTile> visible;
    std::vector<TextVertex> textVerts;

    // Main loop
    while(!glfwWindowShouldClose(window)){
        glfwWaitEventsTimeout(0.25);

        // Tile streaming tick: cache lookups + queueing on the session, uploads here
        if(gDirty.exchange(false)){
            visible = session.redraw(gFbW, gFbH);
        }
        gTextures.frameId++;

        glClearColor(0.08f, 0.09f, 0.10f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);

        glUseProgram(tileProg);
        glUniform4f(glGetUniformLocation(tileProg, "uView"), 0.f, (float)gFbW, (float)gFbH, 0.f);
        glUniform1i(glGetUniformLocation(tileProg, "uTex"), 0);
        glActiveTexture(GL_TEXTURE0);
        glBindVertexArray(quadVao);
        glBindBuffer(GL_ARRAY_BUFFER, quadVbo);
        for(const auto& vt : visible){
            if(!vt.bitmap) continue;
            const float x0 = (float)vt.screenX, y0 = (float)vt.screenY;
            const float x1 = x0 + (float)kTileSize, y1 = y0 + (float)kTileSize;
            const float quad[24] = {
                x0,y0, 0.f,0.f,  x1,y0, 1.f,0.f,  x1,y1, 1.f,1.f,
                x0,y0, 0.f,0.f,  x1,y1, 1.f,1.f,  x0,y1, 0.f,1.f,
            };
            glBindTexture(GL_TEXTURE_2D, gTextures.get(vt.tile, vt.bitmap));
            glBufferSubData(GL_ARRAY_BUFFER, 0, sizeof(quad), quad);
            glDrawArrays(GL_TRIANGLES, 0, 6);
        }
        glBindTexture(GL_TEXTURE_2D, 0);
        glBindVertexArray(0);
        gTextures.evictIfNeeded();

        // Text (single draw)
        if(gTextReady){
            textVerts.clear();
            if(session.getDebugSettings().drawTileCoordinates){
                for(const auto& vt : visible){
                    appendText(textVerts, vt.tile.toString(), (float)vt.screenX + 4.f, (float)vt.screenY + gFontPixelSize,
                               0.1f, 0.1f, 0.1f, 1.f);
                }
            }
            const MapPositionFix fix = session.getMapPosition().getMapPositionFix();
            char status[160];
            std::snprintf(status, sizeof(status), "zoom %d  %.5f, %.5f  queued %zu",
                          (int)fix.zoomLevel, fix.latitude, fix.longitude, session.getJobQueue().size());
            appendText(textVerts, status, 8.f, (float)gFbH - 8.f, 0.f, 0.f, 0.f, 1.f);

            glUseProgram(textProg);
            glUniform4f(glGetUniformLocation(textProg, "uView"), 0.f, (float)gFbW, (float)gFbH, 0.f);
            glActiveTexture(GL_TEXTURE0);
            glBindTexture(GL_TEXTURE_2D, gTextAtlasTex);
            glUniform1i(glGetUniformLocation(textProg, "uTex"), 0);

            glBindVertexArray(textVao);
            glBindBuffer(GL_ARRAY_BUFFER, textVbo);
            glBufferData(GL_ARRAY_BUFFER, (GLsizeiptr)(textVerts.size() * sizeof(TextVertex)), textVerts.data(), GL_STREAM_DRAW);
            glDrawArrays(GL_TRIANGLES, 0, (GLsizei)textVerts.size());
            glBindVertexArray(0);
            glBindTexture(GL_TEXTURE_2D, 0);
        }

        glfwSwapBuffers(window);
    }

    session.destroy();
    gSession = nullptr;
    gTextures.clear();

    glDeleteBuffers(1, &quadVbo);
    glDeleteVertexArrays(1, &quadVao);
    glDeleteBuffers(1, &textVbo);
    glDeleteVertexArrays(1, &textVao);

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
