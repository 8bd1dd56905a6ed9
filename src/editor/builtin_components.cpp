#include "editor/component.h"
#include "editor/game_object.h"

namespace scenelink {
namespace editor {

namespace {

// Reflected member that reads and writes a serialized field under another
// name (Rigidbody.mass -> m_Mass).
ReflectedMember alias(const std::string& name, const std::string& field, PropertyKind kind,
                      const std::vector<std::string>& enum_names = std::vector<std::string>()) {
  ReflectedMember m;
  m.name = name;
  m.kind = kind;
  m.enum_names = enum_names;
  m.getter = [field](const Component& c) { return c.get(field); };
  m.setter = [field](Component& c, const PropertyValue& v) { c.set(field, v); };
  return m;
}

// Reflected member with no serialized backing (Rigidbody.velocity).
ReflectedMember runtime(const std::string& name, const PropertyValue& initial) {
  ReflectedMember m;
  m.name = name;
  m.kind = initial.kind;
  m.getter = [name, initial](const Component& c) { return c.runtimeValue(name, initial); };
  m.setter = [name](Component& c, const PropertyValue& v) { c.setRuntimeValue(name, v); };
  return m;
}

ReflectedMember enabledMember() {
  ReflectedMember m;
  m.name = "enabled";
  m.kind = PropertyKind::BOOLEAN;
  m.getter = [](const Component& c) { return PropertyValue::boolean(c.enabled()); };
  m.setter = [](Component& c, const PropertyValue& v) { c.setEnabled(v.b); };
  return m;
}

SerializedProperty real(const char* name, double value) {
  return SerializedProperty(name, PropertyValue::real(value));
}

SerializedProperty flag(const char* name, bool value) {
  return SerializedProperty(name, PropertyValue::boolean(value));
}

SerializedProperty text(const char* name, const char* value) {
  return SerializedProperty(name, PropertyValue::text(value));
}

SerializedProperty vec3(const char* name, float x, float y, float z) {
  return SerializedProperty(name, PropertyValue::vector3(Vector3(x, y, z)));
}

// Transform members delegate to the owning GameObject so world-space values
// account for the parent chain.
template <typename Get, typename Set>
ReflectedMember transformMember(const char* name, Get get, Set set) {
  ReflectedMember m;
  m.name = name;
  m.kind = PropertyKind::VECTOR3;
  m.getter = [get](const Component& c) {
    return c.gameObject() ? PropertyValue::vector3(get(*c.gameObject()))
                          : PropertyValue::vector3(Vector3());
  };
  m.setter = [set](Component& c, const PropertyValue& v) {
    if (c.gameObject()) {
      set(*c.gameObject(), v.asVector3());
    }
  };
  return m;
}

ComponentType makeTransform() {
  ComponentType t;
  t.name = "Transform";
  t.name_space = "Engine";
  t.removable = false;
  t.defaults.push_back(vec3(kLocalPosition, 0, 0, 0));
  t.defaults.push_back(SerializedProperty(kLocalRotation, PropertyValue::vector4(Vector4(0, 0, 0, 1))));
  t.defaults.push_back(vec3(kLocalScale, 1, 1, 1));
  t.members.push_back(transformMember(
      "position", [](const GameObject& go) { return go.position(); },
      [](GameObject& go, const Vector3& v) { go.setPosition(v); }));
  t.members.push_back(transformMember(
      "localPosition", [](const GameObject& go) { return go.localPosition(); },
      [](GameObject& go, const Vector3& v) { go.setLocalPosition(v); }));
  t.members.push_back(transformMember(
      "eulerAngles", [](const GameObject& go) { return go.rotation().toEuler(); },
      [](GameObject& go, const Vector3& v) { go.setRotation(Quaternion::fromEuler(v)); }));
  t.members.push_back(transformMember(
      "localEulerAngles", [](const GameObject& go) { return go.localRotation().toEuler(); },
      [](GameObject& go, const Vector3& v) { go.setLocalRotation(Quaternion::fromEuler(v)); }));
  t.members.push_back(transformMember(
      "localScale", [](const GameObject& go) { return go.localScale(); },
      [](GameObject& go, const Vector3& v) { go.setLocalScale(v); }));

  ReflectedMember lossy;
  lossy.name = "lossyScale";
  lossy.kind = PropertyKind::VECTOR3;
  lossy.getter = [](const Component& c) {
    return PropertyValue::vector3(c.gameObject() ? c.gameObject()->lossyScale() : Vector3::one());
  };
  t.members.push_back(lossy);
  return t;
}

ComponentType makeCamera() {
  const std::vector<std::string> clear_flags = {"Skybox", "SolidColor", "Depth", "Nothing"};
  ComponentType t;
  t.name = "Camera";
  t.name_space = "Engine";
  t.defaults.push_back(SerializedProperty("m_ClearFlags", 0, clear_flags));
  t.defaults.push_back(SerializedProperty("m_BackGroundColor",
                                          PropertyValue::color(Color(0.19f, 0.30f, 0.47f, 0.0f))));
  t.defaults.push_back(real("m_FieldOfView", 60.0));
  t.defaults.push_back(real("m_NearClipPlane", 0.3));
  t.defaults.push_back(real("m_FarClipPlane", 1000.0));
  t.defaults.push_back(flag("m_Orthographic", false));
  t.defaults.push_back(real("m_OrthographicSize", 5.0));
  t.defaults.push_back(real("m_Depth", -1.0));
  t.members.push_back(enabledMember());
  t.members.push_back(alias("clearFlags", "m_ClearFlags", PropertyKind::ENUM, clear_flags));
  t.members.push_back(alias("backgroundColor", "m_BackGroundColor", PropertyKind::COLOR));
  t.members.push_back(alias("fieldOfView", "m_FieldOfView", PropertyKind::FLOAT));
  t.members.push_back(alias("nearClipPlane", "m_NearClipPlane", PropertyKind::FLOAT));
  t.members.push_back(alias("farClipPlane", "m_FarClipPlane", PropertyKind::FLOAT));
  t.members.push_back(alias("orthographic", "m_Orthographic", PropertyKind::BOOLEAN));
  t.members.push_back(alias("orthographicSize", "m_OrthographicSize", PropertyKind::FLOAT));
  t.members.push_back(alias("depth", "m_Depth", PropertyKind::FLOAT));
  return t;
}

ComponentType makeLight() {
  const std::vector<std::string> light_types = {"Spot", "Directional", "Point", "Area"};
  const std::vector<std::string> shadows = {"None", "Hard", "Soft"};
  ComponentType t;
  t.name = "Light";
  t.name_space = "Engine";
  t.defaults.push_back(SerializedProperty("m_Type", 2, light_types));
  t.defaults.push_back(SerializedProperty("m_Color", PropertyValue::color(Color())));
  t.defaults.push_back(real("m_Intensity", 1.0));
  t.defaults.push_back(real("m_Range", 10.0));
  t.defaults.push_back(real("m_SpotAngle", 30.0));
  t.defaults.push_back(SerializedProperty("m_Shadows", 0, shadows));
  t.members.push_back(enabledMember());
  t.members.push_back(alias("type", "m_Type", PropertyKind::ENUM, light_types));
  t.members.push_back(alias("color", "m_Color", PropertyKind::COLOR));
  t.members.push_back(alias("intensity", "m_Intensity", PropertyKind::FLOAT));
  t.members.push_back(alias("range", "m_Range", PropertyKind::FLOAT));
  t.members.push_back(alias("spotAngle", "m_SpotAngle", PropertyKind::FLOAT));
  t.members.push_back(alias("shadows", "m_Shadows", PropertyKind::ENUM, shadows));
  return t;
}

ComponentType makeMeshFilter() {
  ComponentType t;
  t.name = "MeshFilter";
  t.name_space = "Engine";
  t.defaults.push_back(text("m_Mesh", ""));
  t.members.push_back(alias("sharedMesh", "m_Mesh", PropertyKind::STRING));
  return t;
}

ComponentType makeMeshRenderer() {
  const std::vector<std::string> cast = {"Off", "On", "TwoSided", "ShadowsOnly"};
  ComponentType t;
  t.name = "MeshRenderer";
  t.name_space = "Engine";
  t.defaults.push_back(text("m_Material", "Default-Material"));
  t.defaults.push_back(SerializedProperty("m_CastShadows", 1, cast));
  t.defaults.push_back(flag("m_ReceiveShadows", true));
  t.members.push_back(enabledMember());
  t.members.push_back(alias("sharedMaterial", "m_Material", PropertyKind::STRING));
  t.members.push_back(alias("shadowCastingMode", "m_CastShadows", PropertyKind::ENUM, cast));
  t.members.push_back(alias("receiveShadows", "m_ReceiveShadows", PropertyKind::BOOLEAN));
  return t;
}

ComponentType makeRigidbody() {
  const std::vector<std::string> interpolation = {"None", "Interpolate", "Extrapolate"};
  const std::vector<std::string> detection = {"Discrete", "Continuous", "ContinuousDynamic",
                                              "ContinuousSpeculative"};
  ComponentType t;
  t.name = "Rigidbody";
  t.name_space = "Engine.Physics";
  t.defaults.push_back(real("m_Mass", 1.0));
  t.defaults.push_back(real("m_Drag", 0.0));
  t.defaults.push_back(real("m_AngularDrag", 0.05));
  t.defaults.push_back(flag("m_UseGravity", true));
  t.defaults.push_back(flag("m_IsKinematic", false));
  t.defaults.push_back(SerializedProperty("m_Interpolate", 0, interpolation));
  t.defaults.push_back(SerializedProperty("m_CollisionDetection", 0, detection));
  t.members.push_back(alias("mass", "m_Mass", PropertyKind::FLOAT));
  t.members.push_back(alias("drag", "m_Drag", PropertyKind::FLOAT));
  t.members.push_back(alias("angularDrag", "m_AngularDrag", PropertyKind::FLOAT));
  t.members.push_back(alias("useGravity", "m_UseGravity", PropertyKind::BOOLEAN));
  t.members.push_back(alias("isKinematic", "m_IsKinematic", PropertyKind::BOOLEAN));
  t.members.push_back(alias("interpolation", "m_Interpolate", PropertyKind::ENUM, interpolation));
  t.members.push_back(
      alias("collisionDetectionMode", "m_CollisionDetection", PropertyKind::ENUM, detection));
  t.members.push_back(runtime("velocity", PropertyValue::vector3(Vector3())));
  t.members.push_back(runtime("angularVelocity", PropertyValue::vector3(Vector3())));
  return t;
}

ComponentType makeCollider(const char* name) {
  ComponentType t;
  t.name = name;
  t.name_space = "Engine.Physics";
  t.allow_multiple = true;
  t.defaults.push_back(flag("m_IsTrigger", false));
  t.members.push_back(enabledMember());
  t.members.push_back(alias("isTrigger", "m_IsTrigger", PropertyKind::BOOLEAN));
  return t;
}

ComponentType makeBoxCollider() {
  ComponentType t = makeCollider("BoxCollider");
  t.defaults.push_back(vec3("m_Size", 1, 1, 1));
  t.defaults.push_back(vec3("m_Center", 0, 0, 0));
  t.members.push_back(alias("size", "m_Size", PropertyKind::VECTOR3));
  t.members.push_back(alias("center", "m_Center", PropertyKind::VECTOR3));
  return t;
}

ComponentType makeSphereCollider() {
  ComponentType t = makeCollider("SphereCollider");
  t.defaults.push_back(real("m_Radius", 0.5));
  t.defaults.push_back(vec3("m_Center", 0, 0, 0));
  t.members.push_back(alias("radius", "m_Radius", PropertyKind::FLOAT));
  t.members.push_back(alias("center", "m_Center", PropertyKind::VECTOR3));
  return t;
}

ComponentType makeCapsuleCollider() {
  const std::vector<std::string> axis = {"X-Axis", "Y-Axis", "Z-Axis"};
  ComponentType t = makeCollider("CapsuleCollider");
  t.defaults.push_back(real("m_Radius", 0.5));
  t.defaults.push_back(real("m_Height", 2.0));
  t.defaults.push_back(SerializedProperty("m_Direction", 1, axis));
  t.defaults.push_back(vec3("m_Center", 0, 0, 0));
  t.members.push_back(alias("radius", "m_Radius", PropertyKind::FLOAT));
  t.members.push_back(alias("height", "m_Height", PropertyKind::FLOAT));
  t.members.push_back(alias("direction", "m_Direction", PropertyKind::ENUM, axis));
  t.members.push_back(alias("center", "m_Center", PropertyKind::VECTOR3));
  return t;
}

ComponentType makeMeshCollider() {
  ComponentType t = makeCollider("MeshCollider");
  t.defaults.push_back(flag("m_Convex", false));
  t.defaults.push_back(text("m_Mesh", ""));
  t.members.push_back(alias("convex", "m_Convex", PropertyKind::BOOLEAN));
  t.members.push_back(alias("sharedMesh", "m_Mesh", PropertyKind::STRING));
  return t;
}

ComponentType makeCharacterController() {
  ComponentType t;
  t.name = "CharacterController";
  t.name_space = "Engine.Physics";
  t.defaults.push_back(real("m_Height", 2.0));
  t.defaults.push_back(real("m_Radius", 0.5));
  t.defaults.push_back(real("m_SlopeLimit", 45.0));
  t.defaults.push_back(real("m_StepOffset", 0.3));
  t.defaults.push_back(vec3("m_Center", 0, 0, 0));
  t.members.push_back(alias("height", "m_Height", PropertyKind::FLOAT));
  t.members.push_back(alias("radius", "m_Radius", PropertyKind::FLOAT));
  t.members.push_back(alias("slopeLimit", "m_SlopeLimit", PropertyKind::FLOAT));
  t.members.push_back(alias("stepOffset", "m_StepOffset", PropertyKind::FLOAT));
  t.members.push_back(alias("center", "m_Center", PropertyKind::VECTOR3));
  return t;
}

ComponentType makeAudioListener() {
  ComponentType t;
  t.name = "AudioListener";
  t.name_space = "Engine.Audio";
  t.members.push_back(enabledMember());
  return t;
}

ComponentType makeAudioSource() {
  ComponentType t;
  t.name = "AudioSource";
  t.name_space = "Engine.Audio";
  t.allow_multiple = true;
  t.defaults.push_back(text("m_AudioClip", ""));
  t.defaults.push_back(real("m_Volume", 1.0));
  t.defaults.push_back(real("m_Pitch", 1.0));
  t.defaults.push_back(flag("m_Loop", false));
  t.defaults.push_back(flag("m_PlayOnAwake", true));
  t.defaults.push_back(flag("m_Mute", false));
  t.members.push_back(enabledMember());
  t.members.push_back(alias("clip", "m_AudioClip", PropertyKind::STRING));
  t.members.push_back(alias("volume", "m_Volume", PropertyKind::FLOAT));
  t.members.push_back(alias("pitch", "m_Pitch", PropertyKind::FLOAT));
  t.members.push_back(alias("loop", "m_Loop", PropertyKind::BOOLEAN));
  t.members.push_back(alias("playOnAwake", "m_PlayOnAwake", PropertyKind::BOOLEAN));
  t.members.push_back(alias("mute", "m_Mute", PropertyKind::BOOLEAN));
  t.members.push_back(runtime("time", PropertyValue::real(0.0)));
  return t;
}

ComponentType makeAnimator() {
  ComponentType t;
  t.name = "Animator";
  t.name_space = "Engine.Animation";
  t.defaults.push_back(text("m_Controller", ""));
  t.defaults.push_back(flag("m_ApplyRootMotion", false));
  t.members.push_back(enabledMember());
  t.members.push_back(alias("runtimeAnimatorController", "m_Controller", PropertyKind::STRING));
  t.members.push_back(alias("applyRootMotion", "m_ApplyRootMotion", PropertyKind::BOOLEAN));
  t.members.push_back(runtime("speed", PropertyValue::real(1.0)));
  return t;
}

}  // namespace

void ComponentRegistry::_registerBuiltins() {
  _transform = &registerType(makeTransform());
  registerType(makeCamera());
  registerType(makeLight());
  registerType(makeMeshFilter());
  registerType(makeMeshRenderer());
  registerType(makeRigidbody());
  registerType(makeBoxCollider());
  registerType(makeSphereCollider());
  registerType(makeCapsuleCollider());
  registerType(makeMeshCollider());
  registerType(makeCharacterController());
  registerType(makeAudioListener());
  registerType(makeAudioSource());
  registerType(makeAnimator());
}

}  // namespace editor
}  // namespace scenelink
