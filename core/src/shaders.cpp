// Dotscape - WGSL Sources

#include <dotscape/shaders.h>
#include <iomanip>
#include <sstream>

namespace dotscape::shaders {

// Must match host::stepPoint
static const char* PHYSICS_SHADER = R"(
struct Point {
    position: vec2f,
    velocity: vec2f,
}

@group(0) @binding(0) var<storage, read_write> points: array<Point>;
@group(0) @binding(1) var<uniform> windowSize: vec2f;
@group(0) @binding(2) var<uniform> deltaTime: f32;

@compute @workgroup_size(64)
fn main(@builtin(global_invocation_id) id: vec3u) {
    let idx = id.x;
    if (idx >= arrayLength(&points)) {
        return;
    }

    var p = points[idx];
    p.position = p.position + p.velocity * deltaTime;

    if (p.position.x < 0.0 || p.position.x > windowSize.x) {
        p.velocity.x = -p.velocity.x;
    }
    if (p.position.y < 0.0 || p.position.y > windowSize.y) {
        p.velocity.y = -p.velocity.y;
    }

    p.position = clamp(p.position, vec2f(0.0), windowSize);
    points[idx] = p;
}
)";

static const char* PARTICLE_SHADER = R"(
struct Point {
    position: vec2f,
    velocity: vec2f,
}

@group(0) @binding(0) var<storage, read> points: array<Point>;
@group(0) @binding(1) var<uniform> windowSize: vec2f;
@group(0) @binding(2) var<uniform> pointSize: f32;
@group(0) @binding(3) var<uniform> intensity: f32;

const FALLOFF_START: f32 = 0.75;

struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) local: vec2f,
}

@vertex
fn vs_main(@builtin(vertex_index) vertexIndex: u32,
           @builtin(instance_index) instanceIndex: u32) -> VertexOutput {
    let corner = vec2f(
        select(-1.0, 1.0, (vertexIndex & 1u) != 0u),
        select(-1.0, 1.0, (vertexIndex & 2u) != 0u)
    );
    let world = points[instanceIndex].position + corner * (pointSize * 0.5);

    var output: VertexOutput;
    output.position = vec4f(
        world.x / windowSize.x * 2.0 - 1.0,
        1.0 - world.y / windowSize.y * 2.0,
        0.0,
        1.0
    );
    output.local = corner;
    return output;
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let len = length(input.local);
    if (len >= 1.0) {
        return vec4f(0.0);
    }
    let alpha = min(intensity, (1.0 - (len - FALLOFF_START)) * intensity);
    return vec4f(1.0, 1.0, 1.0, alpha);
}
)";

static const char* POINT_LIST_SHADER = R"(
struct Point {
    position: vec2f,
    velocity: vec2f,
}

@group(0) @binding(0) var<storage, read> points: array<Point>;
@group(0) @binding(1) var<uniform> windowSize: vec2f;
@group(0) @binding(3) var<uniform> intensity: f32;

@vertex
fn vs_main(@builtin(vertex_index) vertexIndex: u32) -> @builtin(position) vec4f {
    let world = points[vertexIndex].position;
    return vec4f(world.x / windowSize.x * 2.0 - 1.0, 1.0 - world.y / windowSize.y * 2.0, 0.0, 1.0);
}

@fragment
fn fs_main() -> @location(0) vec4f {
    return vec4f(1.0, 1.0, 1.0, intensity);
}
)";

static const char* BACKGROUND_SHADER_BODY = R"(
@group(0) @binding(0) var backgroundTexture: texture_2d<f32>;
@group(0) @binding(1) var backgroundSampler: sampler;
@group(0) @binding(2) var<uniform> windowSize: vec2f;
@group(0) @binding(3) var<uniform> windowPos: vec2f;

struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) uv: vec2f,
}

@vertex
fn vs_main(@builtin(vertex_index) vertexIndex: u32) -> VertexOutput {
    let corner = vec2f(f32(vertexIndex & 1u), f32(vertexIndex >> 1u));

    var output: VertexOutput;
    output.position = vec4f(corner * 2.0 - 1.0, 0.0, 1.0);

    var uv = (corner * windowSize + windowPos) / IMAGE_SIZE;
    uv.y = 1.0 - uv.y;
    output.uv = uv;
    return output;
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    return textureSample(backgroundTexture, backgroundSampler, input.uv);
}
)";

const char* physics() {
    return PHYSICS_SHADER;
}

const char* particles() {
    return PARTICLE_SHADER;
}

const char* pointList() {
    return POINT_LIST_SHADER;
}

std::string background(const ImageSize& imageSize) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1);
    ss << "\nconst IMAGE_SIZE: vec2f = vec2f("
       << static_cast<double>(imageSize.width) << ", "
       << static_cast<double>(imageSize.height) << ");\n";
    ss << BACKGROUND_SHADER_BODY;
    return ss.str();
}

} // namespace dotscape::shaders
