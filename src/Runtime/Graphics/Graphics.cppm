export module Graphics;

export import :Texture;
export import :Material;
export import :Geometry;
export import :ShaderConfig;
export import :Shader;
export import :RenderTarget;
export import :Mesh;
export import :RenderView;
export import :MaterialConfig;
export import :Resources;
export import :ReferenceRegistry;
export import :Backend;
export import :HeadlessBackend;
export import :Renderer;
export import :TextureSystem;
export import :ShaderSystem;
export import :MaterialSystem;
export import :GeometrySystem;
export import :Camera;
export import :BuiltinShaders;
export import :RenderViewSystem;
