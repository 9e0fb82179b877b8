export module RHI;

export import :Buffer;
export import :CommandEncoder;
export import :CommandQueue;
export import :ComputePipeline;
export import :Context;
export import :Descriptors;
export import :Device;
export import :Formats;
export import :Image;
export import :Sampler;
export import :Shader;
export import :Staging;
export import :Transcoder;
export import :Types;
export import :Uploader;
